#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace taskorch::db::sqlite {

/*
  Thin RAII wrapper around a shared sqlite3* connection.

  One connection serves every queue loop, so transactions take
  TransactionLock() for their whole lifetime; otherwise statements from
  two threads would interleave inside one BEGIN ... COMMIT.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, DDL, BEGIN/COMMIT). Throws util::StoreError.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize). Throws util::StoreError.
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TransactionLock() {
    return tx_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace taskorch::db::sqlite
