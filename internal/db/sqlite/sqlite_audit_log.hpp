#pragma once

#include <memory>

#include "internal/db/api/audit_log.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace provgate::db::sqlite {

class SqliteAuditLog final : public db::AuditLog {
public:
  // Runs the schema migration on construction.
  explicit SqliteAuditLog(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result AppendReceipt(Transaction&, model::ReceiptRecord&) override;
  std::optional<model::ReceiptRecord> GetReceipt(Transaction&, const std::string&) override;
  std::vector<model::ReceiptRecord> ReadReceipts(Transaction&, const model::ReceiptFilter&, uint64_t start_offset,
                                                 uint64_t max_entries) override;

  Result AppendBatch(Transaction&, model::BatchRow&) override;
  std::vector<model::BatchRow> ReadBatches(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
