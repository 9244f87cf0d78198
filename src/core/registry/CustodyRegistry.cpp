#include "CustodyRegistry.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace pcr {

CustodyRegistry::CustodyRegistry(const RegistryConfig& config)
  : db_(config.db_path, config.schema_path),
    authority_(pinAuthority(db_, config.authority_id)),
    writeStore_(db_.writer()),
    writeLog_(db_.writer()),
    readStore_(db_.reader()),
    readLog_(db_.reader()),
    guard_(authority_, writeStore_),
    registration_(db_, authority_, guard_, writeStore_, writeLog_, config.clock),
    transfers_(db_, guard_, writeStore_, writeLog_, config.clock),
    verification_(readStore_) {
  spdlog::info("custody registry ready: authority {}, {} products, last event seq {}",
               authority_, readStore_.count(), readLog_.lastSequence());
}

// The authority is fixed the first time a database is opened and can never
// change afterwards.
Identity CustodyRegistry::pinAuthority(Database& db, const Identity& configured) {
  Transaction tx(db);

  Statement get(db.writer(), "SELECT value FROM registry_meta WHERE key = 'authority_id'");
  if (get.step()) {
    Identity pinned = get.columnText(0);
    if (!configured.empty() && configured != pinned) {
      throw std::runtime_error("configured authority " + configured +
                               " does not match the authority pinned in the database (" + pinned + ")");
    }
    return pinned;
  }

  if (isNullIdentity(configured)) {
    throw std::runtime_error("an authority identity is required to initialize a new registry");
  }
  Statement put(db.writer(), "INSERT INTO registry_meta (key, value) VALUES ('authority_id', ?)");
  put.bindText(1, configured);
  put.step();
  tx.commit();
  spdlog::info("pinned registering authority {}", configured);
  return configured;
}

Outcome<Product> CustodyRegistry::registerProduct(const Identity& caller,
                                                  const std::string& id,
                                                  const std::string& detailsUri) {
  return registration_.registerProduct(caller, id, detailsUri);
}

Outcome<Product> CustodyRegistry::transfer(const Identity& caller,
                                           const std::string& id,
                                           const std::string& newStatus,
                                           const Identity& newOwner) {
  return transfers_.transfer(caller, id, newStatus, newOwner);
}

Outcome<VerificationResult> CustodyRegistry::verify(const std::string& id) const {
  return verification_.verify(id);
}

namespace {

const std::string& existingPath(const std::string& dbPath) {
  if (!std::filesystem::exists(dbPath)) {
    throw std::runtime_error("no registry database at " + dbPath);
  }
  return dbPath;
}

} // namespace

RegistryReader::RegistryReader(const std::string& dbPath)
  : conn_(existingPath(dbPath), SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX),
    store_(conn_),
    log_(conn_),
    verification_(store_) {}

Outcome<VerificationResult> RegistryReader::verify(const std::string& id) const {
  return verification_.verify(id);
}

} // namespace pcr
