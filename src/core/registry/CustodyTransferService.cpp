#include "CustodyTransferService.hpp"

#include <spdlog/spdlog.h>
#include <utility>

#include "AccessControlGuard.hpp"
#include "AuditEventLog.hpp"
#include "Database.hpp"
#include "ProductStore.hpp"

namespace pcr {

namespace {

Status rejected(const std::string& id, Status st) {
  spdlog::warn("transfer of '{}' rejected: {} ({})", id, errorKindName(st.kind), st.message);
  return st;
}

} // namespace

CustodyTransferService::CustodyTransferService(Database& db,
                                               const AccessControlGuard& guard,
                                               ProductStore& store,
                                               AuditEventLog& log,
                                               Clock clock)
  : db_(db), guard_(guard), store_(store), log_(log), clock_(std::move(clock)) {}

Outcome<Product> CustodyTransferService::transfer(const Identity& caller,
                                                  const std::string& id,
                                                  const std::string& newStatus,
                                                  const Identity& newOwner) {
  Transaction tx(db_);

  auto current = store_.get(id);
  if (!current) {
    return rejected(id, Status::failure(ErrorKind::NotFound, "no such product: " + id));
  }
  if (Status st = guard_.requireCurrentOwner(id, caller); !st.ok()) return rejected(id, st);
  if (isNullIdentity(newOwner)) {
    return rejected(id, Status::failure(ErrorKind::InvalidOwner, "new owner must be a non-null identity"));
  }
  if (newStatus.empty()) {
    return rejected(id, Status::failure(ErrorKind::EmptyStatus, "status must not be empty"));
  }

  if (Status st = store_.update(id, newStatus, newOwner); !st.ok()) return rejected(id, st);
  const int64_t now = clock_();
  const int64_t seq = log_.append(StatusUpdated{id, current->current_owner, newOwner, newStatus, now});
  tx.commit();

  spdlog::info("'{}' -> {} by {} [{}] (seq {})", id, newOwner, current->current_owner, newStatus, seq);

  Product updated = *current;
  updated.status        = newStatus;
  updated.current_owner = newOwner;
  return updated;
}

} // namespace pcr
