#include "VerificationService.hpp"

#include "ProductStore.hpp"

namespace pcr {

VerificationService::VerificationService(const ProductStore& store) : store_(store) {}

Outcome<VerificationResult> VerificationService::verify(const std::string& id) const {
  auto p = store_.get(id);
  if (!p) return Status::failure(ErrorKind::NotFound, "no such product: " + id);
  return VerificationResult{p->is_genuine, p->status, p->current_owner, p->details_uri,
                            p->registration_timestamp};
}

} // namespace pcr
