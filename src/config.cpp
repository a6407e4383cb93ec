#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace relay {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static int GetEnvPositiveInt(const char* name, int fallback) {
  const auto v = GetEnvStr(name);
  if (v.empty()) return fallback;
  char* end = nullptr;
  long n = std::strtol(v.c_str(), &end, 10);
  if (end == v.c_str() || n <= 0) {
    std::cerr << "[config] ignoring invalid " << name << "=" << v << "\n";
    return fallback;
  }
  if (n > 0x7fffffffL) n = 0x7fffffffL;
  return static_cast<int>(n);
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port <= 0) ep.port = ep.scheme == "http" ? 80 : 443;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string EndpointOrigin(const HttpEndpoint& ep) {
  std::string out = ep.scheme + "://" + ep.host;
  const bool default_port = (ep.scheme == "https" && ep.port == 443) || (ep.scheme == "http" && ep.port == 80);
  if (!default_port) out += ":" + std::to_string(ep.port);
  return out;
}

RelayConfig LoadConfigFromEnv() {
  RelayConfig cfg;

  if (auto host = GetEnvStr("RELAY_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  cfg.listen.port = GetEnvPositiveInt("PORT", cfg.listen.port);

  if (auto target = GetEnvStr("TARGET_URL"); !target.empty()) cfg.target_url = target;
  while (!cfg.target_url.empty() && cfg.target_url.back() == '/') cfg.target_url.pop_back();
  cfg.upstream = ParseHttpEndpoint(cfg.target_url);

  cfg.api_key = GetEnvStr("API_KEY");

  cfg.timeouts.connect_seconds = GetEnvPositiveInt("RELAY_CONNECT_TIMEOUT", cfg.timeouts.connect_seconds);
  cfg.timeouts.read_seconds = GetEnvPositiveInt("RELAY_READ_TIMEOUT", cfg.timeouts.read_seconds);
  cfg.timeouts.write_seconds = GetEnvPositiveInt("RELAY_WRITE_TIMEOUT", cfg.timeouts.write_seconds);

  cfg.stream_buffer_bytes = static_cast<size_t>(
      GetEnvPositiveInt("RELAY_STREAM_BUFFER_BYTES", static_cast<int>(cfg.stream_buffer_bytes)));

  return cfg;
}

}  // namespace relay
