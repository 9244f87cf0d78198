#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace pcr {

class Connection;

enum class EventKind { ProductRegistered, StatusUpdated };

const char* eventKindName(EventKind kind);

// Field order is the externally consumed event schema.
struct ProductRegistered {
  std::string id;
  Identity    authority_id;
  int64_t     timestamp = 0;
  std::string details_uri;
};

struct StatusUpdated {
  std::string id;
  Identity    old_owner;
  Identity    new_owner;
  std::string new_status;
  int64_t     timestamp = 0;
};

struct AuditEvent {
  int64_t seq = 0;  // global commit order
  std::variant<ProductRegistered, StatusUpdated> body;

  EventKind kind() const;
  const std::string& productId() const;
  int64_t timestamp() const;
};

// Append-only event log, the sole source of custody history. Queries always
// return events in commit order.
class AuditEventLog {
public:
  explicit AuditEventLog(Connection& conn);

  // Returns the sequence number assigned to the event.
  int64_t append(const ProductRegistered& event);
  int64_t append(const StatusUpdated& event);

  std::vector<AuditEvent> forProduct(const std::string& id) const;

  // Registrations by owner, plus transfers where owner is the old or new holder.
  std::vector<AuditEvent> involvingOwner(const Identity& owner) const;

  // Events with seq > afterSeq, at most limit of them.
  std::vector<AuditEvent> since(int64_t afterSeq, std::size_t limit) const;

  int64_t lastSequence() const;

private:
  Connection& conn_;
};

} // namespace pcr
