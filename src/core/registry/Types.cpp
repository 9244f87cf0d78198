#include "Types.hpp"

namespace pcr {

bool isNullIdentity(const Identity& identity) {
  return identity.empty() || identity == kZeroAddress;
}

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:         return "None";
    case ErrorKind::Unauthorized: return "Unauthorized";
    case ErrorKind::EmptyId:      return "EmptyId";
    case ErrorKind::DuplicateId:  return "DuplicateId";
    case ErrorKind::NotFound:     return "NotFound";
    case ErrorKind::InvalidOwner: return "InvalidOwner";
    case ErrorKind::EmptyStatus:  return "EmptyStatus";
  }
  return "Unknown";
}

} // namespace pcr
