#include "AuditEventLog.hpp"

#include <stdexcept>

#include "Database.hpp"

namespace pcr {

namespace {

constexpr const char* kSelectColumns =
  "SELECT seq, kind, product_id, authority_id, old_owner, new_owner, new_status, details_uri, at "
  "FROM audit_events ";

AuditEvent readRow(const Statement& st) {
  AuditEvent ev;
  ev.seq = st.columnInt64(0);
  const std::string kind = st.columnText(1);
  if (kind == "ProductRegistered") {
    ProductRegistered r;
    r.id           = st.columnText(2);
    r.authority_id = st.columnText(3);
    r.details_uri  = st.columnText(7);
    r.timestamp    = st.columnInt64(8);
    ev.body = std::move(r);
  } else if (kind == "StatusUpdated") {
    StatusUpdated u;
    u.id         = st.columnText(2);
    u.old_owner  = st.columnText(4);
    u.new_owner  = st.columnText(5);
    u.new_status = st.columnText(6);
    u.timestamp  = st.columnInt64(8);
    ev.body = std::move(u);
  } else {
    throw std::runtime_error("unknown audit event kind at seq " + std::to_string(ev.seq) + ": " + kind);
  }
  return ev;
}

std::vector<AuditEvent> collect(Statement& st) {
  std::vector<AuditEvent> out;
  while (st.step()) out.push_back(readRow(st));
  return out;
}

} // namespace

const char* eventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::ProductRegistered: return "ProductRegistered";
    case EventKind::StatusUpdated:     return "StatusUpdated";
  }
  return "Unknown";
}

EventKind AuditEvent::kind() const {
  return std::holds_alternative<ProductRegistered>(body) ? EventKind::ProductRegistered
                                                         : EventKind::StatusUpdated;
}

const std::string& AuditEvent::productId() const {
  return std::visit([](const auto& e) -> const std::string& { return e.id; }, body);
}

int64_t AuditEvent::timestamp() const {
  return std::visit([](const auto& e) { return e.timestamp; }, body);
}

AuditEventLog::AuditEventLog(Connection& conn) : conn_(conn) {}

int64_t AuditEventLog::append(const ProductRegistered& event) {
  const char* sql = R"SQL(
    INSERT INTO audit_events (kind, product_id, authority_id, details_uri, at)
    VALUES ('ProductRegistered',?,?,?,?)
  )SQL";
  Statement st(conn_, sql);
  st.bindText(1, event.id)
    .bindText(2, event.authority_id)
    .bindText(3, event.details_uri)
    .bindInt64(4, event.timestamp);
  st.step();
  return conn_.lastInsertRowId();
}

int64_t AuditEventLog::append(const StatusUpdated& event) {
  const char* sql = R"SQL(
    INSERT INTO audit_events (kind, product_id, old_owner, new_owner, new_status, at)
    VALUES ('StatusUpdated',?,?,?,?,?)
  )SQL";
  Statement st(conn_, sql);
  st.bindText(1, event.id)
    .bindText(2, event.old_owner)
    .bindText(3, event.new_owner)
    .bindText(4, event.new_status)
    .bindInt64(5, event.timestamp);
  st.step();
  return conn_.lastInsertRowId();
}

std::vector<AuditEvent> AuditEventLog::forProduct(const std::string& id) const {
  const std::string sql = std::string(kSelectColumns) + "WHERE product_id = ? ORDER BY seq";
  Statement st(conn_, sql.c_str());
  st.bindText(1, id);
  return collect(st);
}

std::vector<AuditEvent> AuditEventLog::involvingOwner(const Identity& owner) const {
  const std::string sql = std::string(kSelectColumns) +
    "WHERE authority_id = ?1 OR old_owner = ?1 OR new_owner = ?1 ORDER BY seq";
  Statement st(conn_, sql.c_str());
  st.bindText(1, owner);
  return collect(st);
}

std::vector<AuditEvent> AuditEventLog::since(int64_t afterSeq, std::size_t limit) const {
  const std::string sql = std::string(kSelectColumns) + "WHERE seq > ? ORDER BY seq LIMIT ?";
  Statement st(conn_, sql.c_str());
  st.bindInt64(1, afterSeq).bindInt64(2, static_cast<int64_t>(limit));
  return collect(st);
}

int64_t AuditEventLog::lastSequence() const {
  Statement st(conn_, "SELECT COALESCE(MAX(seq), 0) FROM audit_events");
  return st.step() ? st.columnInt64(0) : 0;
}

} // namespace pcr
