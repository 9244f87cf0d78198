#include "AccessControlGuard.hpp"

#include "ProductStore.hpp"

namespace pcr {

AccessControlGuard::AccessControlGuard(const Identity& authority, const ProductStore& store)
  : authority_(authority), store_(store) {}

bool AccessControlGuard::isAuthority(const Identity& caller) const {
  return !isNullIdentity(caller) && caller == authority_;
}

bool AccessControlGuard::isCurrentOwner(const std::string& productId, const Identity& caller) const {
  if (isNullIdentity(caller)) return false;
  auto product = store_.get(productId);
  return product && product->current_owner == caller;
}

Status AccessControlGuard::requireAuthority(const Identity& caller) const {
  if (isAuthority(caller)) return Status::success();
  return Status::failure(ErrorKind::Unauthorized, "caller is not the registering authority");
}

Status AccessControlGuard::requireCurrentOwner(const std::string& productId, const Identity& caller) const {
  if (isCurrentOwner(productId, caller)) return Status::success();
  return Status::failure(ErrorKind::Unauthorized, "caller does not hold custody of " + productId);
}

} // namespace pcr
