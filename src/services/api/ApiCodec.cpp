#include "ApiCodec.hpp"

using nlohmann::json;

namespace pcr {

void to_json(json& j, const Product& p) {
  j = json{
    {"id", p.id},
    {"is_genuine", p.is_genuine},
    {"status", p.status},
    {"current_owner", p.current_owner},
    {"details_uri", p.details_uri},
    {"registration_timestamp", p.registration_timestamp}
  };
}

void to_json(json& j, const VerificationResult& v) {
  j = json{
    {"is_genuine", v.is_genuine},
    {"status", v.status},
    {"current_owner", v.current_owner},
    {"details_uri", v.details_uri},
    {"registration_timestamp", v.registration_timestamp}
  };
}

void to_json(json& j, const AuditEvent& e) {
  j = json{{"seq", e.seq}, {"kind", eventKindName(e.kind())}};
  if (const auto* r = std::get_if<ProductRegistered>(&e.body)) {
    j["id"]           = r->id;
    j["authority_id"] = r->authority_id;
    j["timestamp"]    = r->timestamp;
    j["details_uri"]  = r->details_uri;
  } else if (const auto* u = std::get_if<StatusUpdated>(&e.body)) {
    j["id"]         = u->id;
    j["old_owner"]  = u->old_owner;
    j["new_owner"]  = u->new_owner;
    j["new_status"] = u->new_status;
    j["timestamp"]  = u->timestamp;
  }
}

int httpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:         return 200;
    case ErrorKind::Unauthorized: return 403;
    case ErrorKind::NotFound:     return 404;
    case ErrorKind::DuplicateId:  return 409;
    case ErrorKind::EmptyId:
    case ErrorKind::InvalidOwner:
    case ErrorKind::EmptyStatus:  return 422;
  }
  return 500;
}

json errorBody(const Status& status) {
  return json{{"error", errorKindName(status.kind)}, {"message", status.message}};
}

json eventsBody(const std::vector<AuditEvent>& events) {
  json arr = json::array();
  for (const auto& e : events) arr.push_back(e);
  return json{{"events", arr}};
}

} // namespace pcr
