// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/registry/CustodyRegistry.hpp"
#include "core/registry/LogLevel.hpp"
#include "services/api/ApiCodec.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

static std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static std::string defaultDbPath() {
  return get_env_or("PCR_DB_PATH", "data/custody-registry.db");
}

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/registry/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/registry)");
}

static int envPortOrDefault() {
  try {
    return std::stoi(get_env_or("PCR_PORT", "8080"));
  } catch (const std::logic_error&) {
    spdlog::warn("PCR_PORT is not a number, using 8080");
    return 8080;
  }
}

static void configureLogging() {
  const std::string level = get_env_or("PCR_LOG_LEVEL", "info");
  auto parsed = pcr::parseLogLevel(level);
  if (!parsed) {
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("unknown PCR_LOG_LEVEL '{}', using info", level);
    return;
  }
  spdlog::set_level(*parsed);
}

static pcr::RegistryConfig configFromEnv() {
  pcr::RegistryConfig cfg;
  cfg.db_path      = defaultDbPath();
  cfg.schema_path  = findSchemaPath();
  cfg.authority_id = get_env_or("PCR_AUTHORITY_ID", "");
  return cfg;
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init           # create/upgrade SQLite schema, pin PCR_AUTHORITY_ID\n"
            << "  " << argv0 << " --serve          # start HTTP server (PCR_PORT or 8080)\n"
            << "  " << argv0 << " --verify <id>    # print the current snapshot of a product\n"
            << "  " << argv0 << " --history <id>   # print the product's audit events in commit order\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    configureLogging();
    const std::string cmd = argc > 1 ? argv[1] : "";

    if (cmd == "--init") {
      pcr::CustodyRegistry registry(configFromEnv());
      std::cout << "DB initialized at: " << defaultDbPath()
                << " (authority " << registry.authority() << ")\n";
      return 0;
    }

    if (cmd == "--serve") {
      // Self-heal DB on startup (idempotent)
      pcr::CustodyRegistry registry(configFromEnv());

      // Port + (optional) API key
      const int port = envPortOrDefault();
      const std::string apiKey = get_env_or("PCR_API_KEY", ""); // empty = auth disabled

      pcr::run_http_server(registry, port, apiKey);
      return 0;
    }

    if ((cmd == "--verify" || cmd == "--history") && argc > 2) {
      // Read-only: no schema, no authority, no file creation.
      const std::string dbPath = defaultDbPath();
      if (!std::filesystem::exists(dbPath)) {
        std::cerr << "No registry database at " << dbPath << " (run --init first)\n";
        return 1;
      }
      pcr::RegistryReader registry(dbPath);
      const std::string id = argv[2];

      if (cmd == "--history") {
        std::cout << pcr::eventsBody(registry.events().forProduct(id)).dump(2) << "\n";
        return 0;
      }

      auto out = registry.verify(id);
      if (!out.ok()) {
        std::cerr << pcr::errorBody(out.status()).dump() << "\n";
        return 1;
      }
      nlohmann::json body = out.value();
      body["id"] = id;
      std::cout << body.dump(2) << "\n";
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
