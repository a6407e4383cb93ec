#include "upstream_client.hpp"

#include <httplib.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace relay {
namespace {

constexpr const char* kAnthropicVersion = "2023-06-01";

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, const UpstreamTimeouts& t) {
  auto cli = std::make_unique<httplib::Client>(EndpointOrigin(ep));
  cli->set_connection_timeout(t.connect_seconds);
  cli->set_read_timeout(t.read_seconds);
  cli->set_write_timeout(t.write_seconds);
  return cli;
}

}  // namespace

RequestHeaderList BuildUpstreamHeaders(const std::string& api_key,
                                       const std::string& client_x_api_key,
                                       const std::string& client_authorization) {
  RequestHeaderList out;
  out.emplace_back("Content-Type", "application/json");
  out.emplace_back("anthropic-version", kAnthropicVersion);
  if (!api_key.empty()) {
    out.emplace_back("x-api-key", api_key);
    out.emplace_back("authorization", std::string("Bearer ") + api_key);
    return out;
  }
  if (!client_x_api_key.empty()) out.emplace_back("x-api-key", client_x_api_key);
  if (!client_authorization.empty()) out.emplace_back("authorization", client_authorization);
  return out;
}

std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

UpstreamClient::UpstreamClient(HttpEndpoint endpoint, UpstreamTimeouts timeouts)
    : endpoint_(std::move(endpoint)), timeouts_(timeouts) {}

bool UpstreamClient::Send(const UpstreamRequest& req,
                          const HeadHandler& on_head,
                          const ChunkHandler& on_chunk,
                          std::string* err) const {
  auto cli = MakeClient(endpoint_, timeouts_);
  if (!cli->is_valid()) {
    if (err) *err = "unsupported upstream scheme: " + endpoint_.scheme;
    return false;
  }

  httplib::Request hreq;
  hreq.method = req.method;
  hreq.path = JoinPath(endpoint_.base_path, req.path);
  for (const auto& kv : req.headers) hreq.headers.emplace(kv.first, kv.second);
  hreq.body = req.body;
  bool head_seen = false;
  hreq.response_handler = [&](const httplib::Response& r) {
    head_seen = true;
    UpstreamHead head;
    head.status = r.status;
    head.content_type = r.get_header_value("Content-Type");
    return on_head(head);
  };
  hreq.content_receiver = [&](const char* data, size_t size, uint64_t, uint64_t) { return on_chunk(data, size); };

  auto res = cli->send(hreq);
  if (!res) {
    if (err) *err = httplib::to_string(res.error());
    return false;
  }
  // httplib skips the response handler for bodiless statuses such as 204.
  if (!head_seen) {
    UpstreamHead head;
    head.status = res->status;
    head.content_type = res->get_header_value("Content-Type");
    if (!on_head(head)) {
      if (err) *err = httplib::to_string(httplib::Error::Canceled);
      return false;
    }
  }
  return true;
}

}  // namespace relay
