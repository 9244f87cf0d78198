#pragma once
#include <string>

namespace httplib { class Server; }

namespace pcr {
  class CustodyRegistry;

  // Installs the registry routes, exception and error handlers on svr.
  // Callers identify themselves with X-Caller-Id.
  // apiKey: if empty, the X-API-Key check is disabled.
  void register_routes(httplib::Server& svr,
                       CustodyRegistry& registry,
                       const std::string& apiKey);

  // Start a blocking HTTP server exposing register/transfer/verify and the
  // audit event log.
  void run_http_server(CustodyRegistry& registry,
                       int port,
                       const std::string& apiKey);
}
