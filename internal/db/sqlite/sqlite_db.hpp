#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace provgate::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // One transaction at a time per connection.
  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Creates the audit tables when missing.
  void Migrate();

 private:
  // WAL, synchronous, busy timeout
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// nullptr on failure; the error is left on the connection
Statement Prepare(sqlite3* db, const std::string& sql);

} // namespace provgate::db::sqlite
