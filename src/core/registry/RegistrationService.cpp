#include "RegistrationService.hpp"

#include <spdlog/spdlog.h>
#include <utility>

#include "AccessControlGuard.hpp"
#include "AuditEventLog.hpp"
#include "Database.hpp"
#include "ProductStore.hpp"

namespace pcr {

namespace {

Status rejected(const std::string& id, Status st) {
  spdlog::warn("register '{}' rejected: {} ({})", id, errorKindName(st.kind), st.message);
  return st;
}

} // namespace

RegistrationService::RegistrationService(Database& db,
                                         const Identity& authority,
                                         const AccessControlGuard& guard,
                                         ProductStore& store,
                                         AuditEventLog& log,
                                         Clock clock)
  : db_(db), authority_(authority), guard_(guard), store_(store), log_(log), clock_(std::move(clock)) {}

Outcome<Product> RegistrationService::registerProduct(const Identity& caller,
                                                      const std::string& id,
                                                      const std::string& detailsUri) {
  Transaction tx(db_);

  if (Status st = guard_.requireAuthority(caller); !st.ok()) return rejected(id, st);
  if (id.empty()) {
    return rejected(id, Status::failure(ErrorKind::EmptyId, "product id must not be empty"));
  }
  if (store_.exists(id)) {
    return rejected(id, Status::failure(ErrorKind::DuplicateId, "product already registered: " + id));
  }

  Product p;
  p.id                     = id;
  p.current_owner          = authority_;
  p.registration_timestamp = clock_();
  p.is_genuine             = true;
  p.status                 = kInitialStatus;
  p.details_uri            = detailsUri;

  if (Status st = store_.insert(id, p); !st.ok()) return rejected(id, st);
  const int64_t seq = log_.append(ProductRegistered{id, authority_, p.registration_timestamp, detailsUri});
  tx.commit();

  spdlog::info("registered '{}' (seq {})", id, seq);
  return p;
}

} // namespace pcr
