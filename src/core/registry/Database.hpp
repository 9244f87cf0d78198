#pragma once
#include <cstdint>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace pcr {

// Owns one sqlite3 handle. All SQLite failures surface as std::runtime_error.
class Connection {
public:
  Connection(const std::string& path, int flags);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  sqlite3* handle() const { return db_; }
  void exec(const std::string& sql);
  int changes() const;
  int64_t lastInsertRowId() const;

private:
  sqlite3* db_ = nullptr;
};

// Prepared statement, finalized on scope exit.
class Statement {
public:
  Statement(Connection& conn, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bindText(int index, const std::string& value);
  Statement& bindInt64(int index, int64_t value);

  // true while a row is available, false once the statement is done.
  bool step();

  std::string columnText(int index) const;
  int64_t columnInt64(int index) const;

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

// Writer and reader connections over one WAL-mode database file. Mutations
// go through the writer under writeMutex(); reads use the read-only
// connection and only ever see committed data.
class Database {
public:
  Database(const std::string& dbPath, const std::string& schemaPath);

  Connection& writer() { return writer_; }
  Connection& reader() { return reader_; }
  std::mutex& writeMutex() { return writeMutex_; }

  int schemaVersion();

private:
  Connection writer_;
  Connection reader_;
  std::mutex writeMutex_;
};

// One serialized unit of work: holds the global write lock and an open
// BEGIN IMMEDIATE transaction. Rolls back on destruction unless committed.
class Transaction {
public:
  explicit Transaction(Database& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

private:
  std::unique_lock<std::mutex> lock_;
  Connection& conn_;
  bool committed_ = false;
};

inline constexpr int kSchemaVersion = 1;

// Creates the database file if needed and applies schema.sql (idempotent).
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace pcr
