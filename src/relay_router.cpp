#include "relay_router.hpp"

#include "stream_channel.hpp"
#include "stream_relay.hpp"
#include "transform_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace relay {
namespace {

constexpr const char* kProxyVersion = "anyrouter-relay/2.0";

// State shared between the handler, the upstream reader thread and the
// chunked content provider. Whichever finishes last frees it.
struct UpstreamExchange {
  explicit UpstreamExchange(size_t capacity_bytes) : channel(capacity_bytes) {}

  struct HeadResult {
    std::optional<UpstreamHead> head;
    std::string error;
  };

  StreamChannel channel;
  std::promise<HeadResult> head_promise;
};

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool HasRequestBody(const std::string& method) {
  return method == "POST" || method == "PUT" || method == "PATCH";
}

static nlohmann::json MakeProxyError(const std::string& message) {
  nlohmann::json j;
  j["error"] = {{"type", "proxy_error"}, {"message", message}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_header("Access-Control-Allow-Origin", "*");
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static void SendUpstreamError(httplib::Response* res, const std::string& message) {
  std::cerr << "[proxy] upstream error: " << message << "\n";
  SendJson(res, 502, MakeProxyError("Upstream error: " + message));
}

static std::string RequestTarget(const httplib::Request& req) {
  return req.target.empty() ? req.path : req.target;
}

static void StartUpstreamExchange(const UpstreamClient& upstream,
                                  UpstreamRequest ureq,
                                  const std::shared_ptr<UpstreamExchange>& exchange) {
  std::thread([upstream, ureq = std::move(ureq), exchange]() {
    bool head_delivered = false;
    std::string err;
    const bool ok = upstream.Send(
        ureq,
        [&](const UpstreamHead& head) {
          head_delivered = true;
          UpstreamExchange::HeadResult r;
          r.head = head;
          exchange->head_promise.set_value(std::move(r));
          return true;
        },
        [&](const char* data, size_t size) { return exchange->channel.Push(std::string(data, size)); },
        &err);

    if (!head_delivered) {
      UpstreamExchange::HeadResult r;
      r.error = err.empty() ? std::string("no response from upstream") : err;
      exchange->head_promise.set_value(std::move(r));
      exchange->channel.Close();
      return;
    }
    if (ok || exchange->channel.Cancelled()) {
      exchange->channel.Close();
    } else {
      exchange->channel.Fail(err);
    }
  }).detach();
}

}  // namespace

RelayRouter::RelayRouter(RelayConfig cfg) : cfg_(std::move(cfg)), upstream_(cfg_.upstream, cfg_.timeouts) {}

void RelayRouter::HandleHealth(const httplib::Request&, httplib::Response& res) const {
  nlohmann::json j;
  j["status"] = "ok";
  j["target"] = cfg_.target_url;
  j["proxy"] = kProxyVersion;
  SendJson(&res, 200, j);
}

void RelayRouter::HandlePreflight(const httplib::Request&, httplib::Response& res) const {
  res.status = 204;
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  res.set_header("Access-Control-Allow-Headers", "*");
  res.set_header("Access-Control-Max-Age", "86400");
}

void RelayRouter::HandleProxy(const httplib::Request& req, httplib::Response& res) const {
  if (!StartsWith(req.path, "/v1/")) {
    return SendJson(&res, 404, MakeProxyError("Not found: " + RequestTarget(req)));
  }

  UpstreamRequest ureq;
  ureq.method = req.method;
  ureq.path = RequestTarget(req);
  ureq.headers = BuildUpstreamHeaders(cfg_.api_key, req.get_header_value("x-api-key"),
                                      req.get_header_value("authorization"));

  bool stream = false;
  if (HasRequestBody(req.method)) {
    if (!req.body.empty() && IsMessagesPath(req.path)) {
      std::string err;
      auto prepared = TransformRequestBody(req.body, &err);
      if (!prepared) return SendUpstreamError(&res, err);
      stream = prepared->stream;
      ureq.body = std::move(prepared->body);
      std::cout << "[proxy] " << req.method << " " << req.path << " -> transformed (model="
                << (prepared->model.empty() ? "-" : prepared->model) << ", stream=" << (stream ? 1 : 0) << ")\n";
    } else {
      ureq.body = req.body;
    }
  }

  auto exchange = std::make_shared<UpstreamExchange>(cfg_.stream_buffer_bytes);
  auto head_future = exchange->head_promise.get_future();
  StartUpstreamExchange(upstream_, std::move(ureq), exchange);

  auto head_result = head_future.get();
  if (!head_result.head) return SendUpstreamError(&res, head_result.error);
  const UpstreamHead head = *head_result.head;

  if (stream && head.content_type.find("text/event-stream") != std::string::npos) {
    res.status = head.status;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_chunked_content_provider(
        "text/event-stream",
        [exchange](size_t, httplib::DataSink& sink) {
          SseStreamRelay relay([&sink](const std::string& event) {
            if (sink.is_writable && !sink.is_writable()) return false;
            if (!sink.write) return false;
            return sink.write(event.data(), event.size());
          });
          while (auto chunk = exchange->channel.Pop()) {
            if (!relay.Feed(*chunk)) {
              exchange->channel.Cancel();
              return false;
            }
          }
          if (auto failure = exchange->channel.Failure()) {
            std::cerr << "[proxy] SSE stream error: " << *failure << "\n";
          } else if (!relay.Finish()) {
            exchange->channel.Cancel();
            return false;
          }
          sink.done();
          return true;
        },
        [exchange](bool) { exchange->channel.Cancel(); });
    return;
  }

  std::string body;
  while (auto chunk = exchange->channel.Pop()) body += *chunk;
  if (auto failure = exchange->channel.Failure()) return SendUpstreamError(&res, *failure);

  if (head.content_type.find("application/json") != std::string::npos) body = RepairResponseBody(body);

  res.status = head.status;
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_content(body, head.content_type.empty() ? "application/json" : head.content_type);
}

void RelayRouter::Register(httplib::Server* server) {
  server->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { HandleHealth(req, res); });
  server->Options(R"(.*)", [this](const httplib::Request& req, httplib::Response& res) { HandlePreflight(req, res); });

  auto proxy = [this](const httplib::Request& req, httplib::Response& res) { HandleProxy(req, res); };
  server->Get(R"(.*)", proxy);
  server->Post(R"(.*)", proxy);
  server->Put(R"(.*)", proxy);
  server->Patch(R"(.*)", proxy);
  server->Delete(R"(.*)", proxy);
}

}  // namespace relay
