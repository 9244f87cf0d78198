#pragma once
#include <cstddef>
#include <string>

#include "AccessControlGuard.hpp"
#include "AuditEventLog.hpp"
#include "CustodyTransferService.hpp"
#include "Database.hpp"
#include "ProductStore.hpp"
#include "RegistrationService.hpp"
#include "Types.hpp"
#include "VerificationService.hpp"

namespace pcr {

struct RegistryConfig {
  std::string db_path;
  std::string schema_path;
  // Required when the database is new; must match the pinned value otherwise.
  Identity    authority_id;
  Clock       clock = systemClock();
};

// Wires the store, log, guard and services over one database. Mutations use
// the writer connection, reads (verify, event queries) the reader.
class CustodyRegistry {
public:
  explicit CustodyRegistry(const RegistryConfig& config);

  const Identity& authority() const { return authority_; }

  Outcome<Product> registerProduct(const Identity& caller,
                                   const std::string& id,
                                   const std::string& detailsUri);

  Outcome<Product> transfer(const Identity& caller,
                            const std::string& id,
                            const std::string& newStatus,
                            const Identity& newOwner);

  Outcome<VerificationResult> verify(const std::string& id) const;

  const AuditEventLog& events() const { return readLog_; }
  std::size_t productCount() const { return readStore_.count(); }

private:
  static Identity pinAuthority(Database& db, const Identity& configured);

  Database               db_;
  const Identity         authority_;
  ProductStore           writeStore_;
  AuditEventLog          writeLog_;
  ProductStore           readStore_;
  AuditEventLog          readLog_;
  AccessControlGuard     guard_;
  RegistrationService    registration_;
  CustodyTransferService transfers_;
  VerificationService    verification_;
};

// Read-only view over an existing registry database. Never creates the file,
// applies the schema or pins an authority.
class RegistryReader {
public:
  explicit RegistryReader(const std::string& dbPath);

  Outcome<VerificationResult> verify(const std::string& id) const;
  const AuditEventLog& events() const { return log_; }

private:
  Connection          conn_;
  ProductStore        store_;
  AuditEventLog       log_;
  VerificationService verification_;
};

} // namespace pcr
