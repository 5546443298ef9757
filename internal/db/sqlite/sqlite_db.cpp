#include "sqlite_db.hpp"

#include <stdexcept>

namespace provgate::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Migrate() {
  static const char* kSchema[] = {
      "CREATE TABLE IF NOT EXISTS receipts ("
      " log_offset INTEGER PRIMARY KEY,"
      " receipt_id TEXT NOT NULL UNIQUE,"
      " operation_id TEXT NOT NULL,"
      " stage INTEGER NOT NULL,"
      " issued_at_us INTEGER NOT NULL,"
      " digest TEXT NOT NULL,"
      " payload BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS receipts_operation ON receipts(operation_id, log_offset);",
      "CREATE INDEX IF NOT EXISTS receipts_issued_at ON receipts(issued_at_us);",
      "CREATE TABLE IF NOT EXISTS batches ("
      " sequence INTEGER PRIMARY KEY,"
      " batch_id TEXT NOT NULL UNIQUE,"
      " sealed_at_us INTEGER NOT NULL,"
      " payload BLOB NOT NULL);",
      // append-only: reject any rewrite of evidence
      "CREATE TRIGGER IF NOT EXISTS receipts_no_update BEFORE UPDATE ON receipts BEGIN SELECT RAISE(ABORT, 'receipts are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS receipts_no_delete BEFORE DELETE ON receipts BEGIN SELECT RAISE(ABORT, 'receipts are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS batches_no_update BEFORE UPDATE ON batches BEGIN SELECT RAISE(ABORT, 'batches are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS batches_no_delete BEFORE DELETE ON batches BEGIN SELECT RAISE(ABORT, 'batches are append-only'); END;"};

  for (const char* sql : kSchema) {
    Exec(sql);
  }
}

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

} // namespace provgate::db::sqlite
