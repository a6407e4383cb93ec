#pragma once

#include "config.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace relay {

struct UpstreamRequest {
  std::string method = "POST";
  // Path relative to the endpoint's base path, query string included.
  std::string path;
  RequestHeaderList headers;
  std::string body;
};

struct UpstreamHead {
  int status = 0;
  std::string content_type;
};

// Only authentication headers are taken from the client; a configured fixed
// key replaces whatever the client sent.
RequestHeaderList BuildUpstreamHeaders(const std::string& api_key,
                                       const std::string& client_x_api_key,
                                       const std::string& client_authorization);

std::string JoinPath(const std::string& base, const std::string& path);

class UpstreamClient {
 public:
  using HeadHandler = std::function<bool(const UpstreamHead& head)>;
  using ChunkHandler = std::function<bool(const char* data, size_t size)>;

  UpstreamClient(HttpEndpoint endpoint, UpstreamTimeouts timeouts);

  // Performs one request. `on_head` runs once when the status line and
  // headers are in, then `on_chunk` runs for each body fragment in order.
  // Either handler returning false aborts the transfer. Returns false with
  // `err` set when the transfer did not complete.
  bool Send(const UpstreamRequest& req, const HeadHandler& on_head, const ChunkHandler& on_chunk,
            std::string* err) const;

 private:
  HttpEndpoint endpoint_;
  UpstreamTimeouts timeouts_;
};

}  // namespace relay
