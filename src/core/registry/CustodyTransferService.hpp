#pragma once
#include <string>

#include "Types.hpp"

namespace pcr {

class AccessControlGuard;
class AuditEventLog;
class Database;
class ProductStore;

// Moves custody of a registered product to a new holder. Only the current
// holder may do so; afterwards the previous holder has no write access.
class CustodyTransferService {
public:
  CustodyTransferService(Database& db,
                         const AccessControlGuard& guard,
                         ProductStore& store,
                         AuditEventLog& log,
                         Clock clock);

  // Preconditions are checked in order NotFound, Unauthorized, InvalidOwner,
  // EmptyStatus. Returns the new snapshot.
  Outcome<Product> transfer(const Identity& caller,
                            const std::string& id,
                            const std::string& newStatus,
                            const Identity& newOwner);

private:
  Database&                 db_;
  const AccessControlGuard& guard_;
  ProductStore&             store_;
  AuditEventLog&            log_;
  Clock                     clock_;
};

} // namespace pcr
