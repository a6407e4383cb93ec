#include "config.hpp"
#include "relay_router.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <string>

namespace {

httplib::Server* g_server = nullptr;

extern "C" void HandleStopSignal(int) {
  if (g_server) g_server->stop();
}

}  // namespace

int main() {
  auto cfg = relay::LoadConfigFromEnv();

  httplib::Server server;
  relay::RelayRouter router(cfg);
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message;
    try {
      if (ep) std::rethrow_exception(ep);
      message = "unknown exception";
    } catch (const std::exception& e) {
      message = e.what();
    } catch (...) {
      message = "non-standard exception";
    }
    std::cerr << "[proxy] Error: " << message << "\n";
    nlohmann::json j;
    j["error"] = {{"type", "proxy_error"}, {"message", "Upstream error: " + message}};
    res.status = 502;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(cfg.timeouts.write_seconds);

  g_server = &server;
  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);

  std::cout << "[proxy] upstream=" << relay::EndpointOrigin(cfg.upstream) << cfg.upstream.base_path
            << " fixed_key=" << (cfg.api_key.empty() ? "no" : "yes") << "\n";
  std::cout << "[proxy] stream_buffer_bytes=" << cfg.stream_buffer_bytes
            << " read_timeout=" << cfg.timeouts.read_seconds << "s\n";
  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  g_server = nullptr;
  return ok ? 0 : 1;
}
