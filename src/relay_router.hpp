#pragma once

#include "config.hpp"
#include "upstream_client.hpp"

#include <httplib.h>

namespace relay {

class RelayRouter {
 public:
  explicit RelayRouter(RelayConfig cfg);
  void Register(httplib::Server* server);

 private:
  void HandleHealth(const httplib::Request& req, httplib::Response& res) const;
  void HandlePreflight(const httplib::Request& req, httplib::Response& res) const;
  void HandleProxy(const httplib::Request& req, httplib::Response& res) const;

  RelayConfig cfg_;
  UpstreamClient upstream_;
};

}  // namespace relay
