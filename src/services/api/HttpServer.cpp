#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "core/registry/CustodyRegistry.hpp"
#include "services/api/ApiCodec.hpp"

using nlohmann::json;

// -------- helpers --------

static constexpr std::size_t kDefaultEventPage = 100;
static constexpr std::size_t kMaxEventPage = 1000;

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string caller_of(const httplib::Request& req) {
  return req.get_header_value("X-Caller-Id");
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, const pcr::Status& st) {
  send_json(res, pcr::httpStatusFor(st.kind), pcr::errorBody(st));
}

// Parses the request body as a JSON object; answers 400 and returns false otherwise.
static bool parse_body(const httplib::Request& req, httplib::Response& res, json& out) {
  try {
    out = json::parse(req.body);
  } catch (const json::parse_error&) {
    res.status = 400; res.set_content("invalid JSON body", "text/plain"); return false;
  }
  if (!out.is_object()) {
    res.status = 400; res.set_content("JSON body must be an object", "text/plain"); return false;
  }
  return true;
}

static std::string get_s(const json& j, const char* k) {
  if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
  return {};
}

// Whole-string decimal parse; rejects signs, trailing junk and overflow.
static bool parse_count(const std::string& s, uint64_t& out) {
  if (s.empty() || s[0] < '0' || s[0] > '9') return false;
  try {
    std::size_t pos = 0;
    out = std::stoull(s, &pos);
    return pos == s.size();
  } catch (const std::out_of_range&) {
    return false;
  }
}

// -------- server --------

namespace pcr {

void register_routes(httplib::Server& svr,
                     CustodyRegistry& registry,
                     const std::string& apiKey) {
  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /products
  // Body: {"id": "...", "details_uri": "..."}; caller must be the authority.
  svr.Post("/products", [&registry, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json j;
    if (!parse_body(req, res, j)) return;

    auto out = registry.registerProduct(caller_of(req), get_s(j, "id"), get_s(j, "details_uri"));
    if (!out.ok()) { send_error(res, out.status()); return; }
    send_json(res, 201, out.value());
  });

  // POST /products/{id}/transfer
  // Body: {"new_status": "...", "new_owner": "..."}; caller must hold custody.
  svr.Post(R"(/products/([^/]+)/transfer)", [&registry, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json j;
    if (!parse_body(req, res, j)) return;

    const std::string id = req.matches[1];
    auto out = registry.transfer(caller_of(req), id, get_s(j, "new_status"), get_s(j, "new_owner"));
    if (!out.ok()) { send_error(res, out.status()); return; }
    send_json(res, 200, out.value());
  });

  // GET /products/{id}/events: custody history in commit order
  svr.Get(R"(/products/([^/]+)/events)", [&registry, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    send_json(res, 200, eventsBody(registry.events().forProduct(req.matches[1])));
  });

  // GET /products/{id}: public verification, no caller identity needed
  svr.Get(R"(/products/([^/]+))", [&registry](const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    auto out = registry.verify(id);
    if (!out.ok()) { send_error(res, out.status()); return; }
    json body = out.value();
    body["id"] = id;
    send_json(res, 200, body);
  });

  // GET /events?owner=<identity>  or  /events?since=<seq>&limit=<n>
  svr.Get("/events", [&registry, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;

    const std::string owner = param_or(req, "owner");
    if (!owner.empty()) {
      send_json(res, 200, eventsBody(registry.events().involvingOwner(owner)));
      return;
    }

    uint64_t since = 0;
    uint64_t limit = kDefaultEventPage;
    if (!parse_count(param_or(req, "since", "0"), since) ||
        !parse_count(param_or(req, "limit", std::to_string(kDefaultEventPage)), limit) ||
        since > static_cast<uint64_t>(INT64_MAX)) {
      res.status = 400; res.set_content("since/limit must be non-negative integers", "text/plain"); return;
    }
    if (limit > kMaxEventPage) limit = kMaxEventPage;

    json body = eventsBody(registry.events().since(static_cast<int64_t>(since),
                                                   static_cast<std::size_t>(limit)));
    body["last_seq"] = registry.events().lastSequence();
    send_json(res, 200, body);
  });

  // Storage failures surface as 500; the transaction has already rolled back.
  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    try {
      if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
    }
    res.status = 500;
    res.set_content("internal error", "text/plain");
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

void run_http_server(CustodyRegistry& registry,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;
  register_routes(svr, registry, apiKey);

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace pcr
