#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace relay {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 5489;
};

struct HttpEndpoint {
  std::string scheme = "https";
  std::string host = "anyrouter.top";
  int port = 443;
  std::string base_path;
};

struct UpstreamTimeouts {
  int connect_seconds = 10;
  int read_seconds = 600;
  int write_seconds = 60;
};

struct RelayConfig {
  HttpListenConfig listen;
  std::string target_url = "https://anyrouter.top";
  HttpEndpoint upstream;
  std::string api_key;
  UpstreamTimeouts timeouts;
  size_t stream_buffer_bytes = 1024 * 1024;
};

HttpEndpoint ParseHttpEndpoint(const std::string& url);
std::string EndpointOrigin(const HttpEndpoint& ep);

RelayConfig LoadConfigFromEnv();

using RequestHeaderList = std::vector<std::pair<std::string, std::string>>;

}  // namespace relay
