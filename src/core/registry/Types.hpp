#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace pcr {

// Opaque party identity (account address, certificate subject, ...).
using Identity = std::string;

inline constexpr const char* kZeroAddress = "0x0000000000000000000000000000000000000000";
inline constexpr const char* kInitialStatus = "Registered at Manufacturing";

// Empty string and the zero address never name a real party.
bool isNullIdentity(const Identity& identity);

// Seconds since epoch. Injected so tests can pin timestamps.
using Clock = std::function<int64_t()>;

inline Clock systemClock() {
  return [] { return static_cast<int64_t>(std::time(nullptr)); };
}

// Current snapshot of one product. History lives in the audit log only.
struct Product {
  std::string id;
  Identity    current_owner;
  int64_t     registration_timestamp = 0;
  bool        is_genuine = true;  // reserved for revocation, always true today
  std::string status;
  std::string details_uri;
};

struct VerificationResult {
  bool        is_genuine = false;
  std::string status;
  Identity    current_owner;
  std::string details_uri;
  int64_t     registration_timestamp = 0;
};

enum class ErrorKind {
  None,
  Unauthorized,
  EmptyId,
  DuplicateId,
  NotFound,
  InvalidOwner,
  EmptyStatus,
};

const char* errorKindName(ErrorKind kind);

struct Status {
  ErrorKind   kind = ErrorKind::None;
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }

  static Status success() { return {}; }
  static Status failure(ErrorKind kind, std::string message) {
    return {kind, std::move(message)};
  }
};

// Either a value or the domain error that prevented producing it.
template <typename T>
class Outcome {
public:
  Outcome(T value) : value_(std::move(value)) {}
  Outcome(Status status) : status_(std::move(status)) {
    if (status_.ok()) throw std::logic_error("Outcome built from a success status without a value");
  }

  bool ok() const { return status_.ok(); }
  ErrorKind error() const { return status_.kind; }
  const Status& status() const { return status_; }

  const T& value() const { return *value_; }
  const T* operator->() const { return &*value_; }

private:
  Status           status_;
  std::optional<T> value_;
};

} // namespace pcr
