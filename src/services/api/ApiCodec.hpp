#pragma once
#include <nlohmann/json.hpp>
#include <vector>

#include "core/registry/AuditEventLog.hpp"
#include "core/registry/Types.hpp"

namespace pcr {

void to_json(nlohmann::json& j, const Product& p);
void to_json(nlohmann::json& j, const VerificationResult& v);
void to_json(nlohmann::json& j, const AuditEvent& e);

// HTTP status answering a domain error.
int httpStatusFor(ErrorKind kind);

// {"error": "<Kind>", "message": "..."}
nlohmann::json errorBody(const Status& status);

nlohmann::json eventsBody(const std::vector<AuditEvent>& events);

} // namespace pcr
