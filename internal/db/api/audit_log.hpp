#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/batch_record.hpp"
#include "internal/db/model/receipt_record.hpp"
#include "result.hpp"
#include "transaction.hpp"

namespace provgate::db {

/*
  Append-only audit log.

  Receipts get dense offsets in append order. AppendReceipt returns
  AlreadyExists (and writes nothing) when the receipt id is already stored,
  which callers treat as an idempotent no-op. Nothing is ever updated or
  deleted.
*/
class AuditLog {
public:
  virtual ~AuditLog() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Assigns record.offset on success.
  virtual Result AppendReceipt(Transaction&, model::ReceiptRecord& record) = 0;

  virtual std::optional<model::ReceiptRecord> GetReceipt(Transaction&, const std::string& receipt_id) = 0;

  // Matching receipts with offset >= start_offset, ascending, at most max_entries.
  virtual std::vector<model::ReceiptRecord> ReadReceipts(Transaction&, const model::ReceiptFilter& filter, uint64_t start_offset,
                                                         uint64_t max_entries) = 0;

  virtual Result AppendBatch(Transaction&, model::BatchRow& row) = 0;

  // All batches in seal order.
  virtual std::vector<model::BatchRow> ReadBatches(Transaction&) = 0;
};

}
