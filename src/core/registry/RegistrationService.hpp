#pragma once
#include <string>

#include "Types.hpp"

namespace pcr {

class AccessControlGuard;
class AuditEventLog;
class Database;
class ProductStore;

class RegistrationService {
public:
  RegistrationService(Database& db,
                      const Identity& authority,
                      const AccessControlGuard& guard,
                      ProductStore& store,
                      AuditEventLog& log,
                      Clock clock);

  // Creates the product owned by the authority and logs ProductRegistered.
  // Fails Unauthorized, EmptyId or DuplicateId with nothing written.
  Outcome<Product> registerProduct(const Identity& caller,
                                   const std::string& id,
                                   const std::string& detailsUri);

private:
  Database&                 db_;
  const Identity&           authority_;
  const AccessControlGuard& guard_;
  ProductStore&             store_;
  AuditEventLog&            log_;
  Clock                     clock_;
};

} // namespace pcr
