#include "Database.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pcr {

namespace {

std::string readSchema(const std::string& schemaPath) {
  std::ifstream in(schemaPath);
  if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
  std::ostringstream buf; buf << in.rdbuf();
  return buf.str();
}

void applySchema(Connection& conn, const std::string& schemaPath) {
  // Pragmas: concurrency + durability + integrity
  conn.exec("PRAGMA journal_mode=WAL;");
  conn.exec("PRAGMA synchronous=NORMAL;");
  conn.exec("PRAGMA foreign_keys=ON;");
  conn.exec("PRAGMA busy_timeout=5000;");

  // CREATE ... IF NOT EXISTS throughout, safe to re-run on every start
  conn.exec(readSchema(schemaPath));
  conn.exec("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
}

void ensureParentDir(const std::string& dbPath) {
  std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);
}

// Runs the idempotent init before the writer connection opens the file.
const std::string& preparedPath(const std::string& dbPath, const std::string& schemaPath) {
  initDatabase(dbPath, schemaPath);
  return dbPath;
}

constexpr int kWriterFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
constexpr int kReaderFlags = SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;

} // namespace

// ---------- Connection ----------

Connection::Connection(const std::string& path, int flags) {
  int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open DB " + path + ": " + msg);
  }
  sqlite3_busy_timeout(db_, 5000);
}

Connection::~Connection() {
  if (db_) sqlite3_close(db_);
}

void Connection::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

int Connection::changes() const {
  return sqlite3_changes(db_);
}

int64_t Connection::lastInsertRowId() const {
  return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

// ---------- Statement ----------

Statement::Statement(Connection& conn, const char* sql) : db_(conn.handle()) {
  if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db_);
    sqlite3_finalize(st_);
    throw std::runtime_error("SQLite prepare failed: " + err);
  }
}

Statement::~Statement() {
  sqlite3_finalize(st_);
}

Statement& Statement::bindText(int index, const std::string& value) {
  // Explicit length: ids and identities are opaque and may contain NUL bytes.
  sqlite3_bind_text(st_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  return *this;
}

Statement& Statement::bindInt64(int index, int64_t value) {
  sqlite3_bind_int64(st_, index, value);
  return *this;
}

bool Statement::step() {
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error("SQLite step failed: " + std::string(sqlite3_errmsg(db_)));
}

std::string Statement::columnText(int index) const {
  const unsigned char* text = sqlite3_column_text(st_, index);
  if (!text) return std::string();
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(st_, index)));
}

int64_t Statement::columnInt64(int index) const {
  return static_cast<int64_t>(sqlite3_column_int64(st_, index));
}

// ---------- Database ----------

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  ensureParentDir(dbPath);
  Connection conn(dbPath, kWriterFlags);
  applySchema(conn, schemaPath);
  return true;
}

// The reader is opened only after the writer created the file and schema.
Database::Database(const std::string& dbPath, const std::string& schemaPath)
  : writer_(preparedPath(dbPath, schemaPath), kWriterFlags),
    reader_(dbPath, kReaderFlags) {
  writer_.exec("PRAGMA foreign_keys=ON;");
  spdlog::debug("database open at {} (schema v{})", dbPath, schemaVersion());
}

int Database::schemaVersion() {
  Statement st(reader_, "PRAGMA user_version;");
  return st.step() ? static_cast<int>(st.columnInt64(0)) : 0;
}

// ---------- Transaction ----------

Transaction::Transaction(Database& db)
  : lock_(db.writeMutex()), conn_(db.writer()) {
  conn_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (committed_) return;
  char* err = nullptr;
  if (sqlite3_exec(conn_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("rollback failed: {}", err ? err : "unknown error");
  }
  sqlite3_free(err);
}

void Transaction::commit() {
  conn_.exec("COMMIT;");
  committed_ = true;
}

} // namespace pcr
