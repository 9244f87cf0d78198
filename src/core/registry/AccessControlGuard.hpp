#pragma once
#include <string>

#include "Types.hpp"

namespace pcr {

class ProductStore;

// Capability checks against the registering authority and the current
// holder of a product. Never mutates anything.
class AccessControlGuard {
public:
  AccessControlGuard(const Identity& authority, const ProductStore& store);

  bool isAuthority(const Identity& caller) const;
  bool isCurrentOwner(const std::string& productId, const Identity& caller) const;

  // Unauthorized with a reason, or success.
  Status requireAuthority(const Identity& caller) const;
  Status requireCurrentOwner(const std::string& productId, const Identity& caller) const;

private:
  const Identity&     authority_;
  const ProductStore& store_;
};

} // namespace pcr
