#pragma once
#include <string>

#include "Types.hpp"

namespace pcr {

class ProductStore;

// Public read of the latest snapshot. History comes from AuditEventLog.
class VerificationService {
public:
  explicit VerificationService(const ProductStore& store);

  Outcome<VerificationResult> verify(const std::string& id) const;

private:
  const ProductStore& store_;
};

} // namespace pcr
