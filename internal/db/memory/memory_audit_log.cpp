#include "memory_audit_log.hpp"

#include "memory_tx.hpp"

namespace provgate::db::memory {

MemoryAuditLog::MemoryAuditLog() = default;

std::unique_ptr<db::Transaction> MemoryAuditLog::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryAuditLog::HasReceiptLocked(const MemoryTransaction& tx, const std::string& receipt_id) const {
  return committed_.receipt_index.contains(receipt_id) || tx.Writes().receipt_index.contains(receipt_id);
}

Result MemoryAuditLog::AppendReceipt(Transaction& t, model::ReceiptRecord& record) {
  auto& tx = TX(t);
  if (record.receipt_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "receipt id is empty");
  }
  if (HasReceiptLocked(tx, record.receipt_id)) {
    return Result::Err(ErrorCode::AlreadyExists, record.receipt_id);
  }

  auto& writes  = tx.Writes();
  record.offset = committed_.receipts.size() + writes.receipts.size();
  writes.receipt_index[record.receipt_id] = record.offset;
  writes.receipts.push_back(record);
  return Result::Ok();
}

std::optional<model::ReceiptRecord> MemoryAuditLog::GetReceipt(Transaction& t, const std::string& receipt_id) {
  const auto& tx = TX(t);
  for (const auto* state : {&tx.Committed(), &tx.Writes()}) {
    const auto it = state->receipt_index.find(receipt_id);
    if (it == state->receipt_index.end()) continue;
    for (const auto& record : state->receipts) {
      if (record.offset == it->second) return record;
    }
  }
  return std::nullopt;
}

std::vector<model::ReceiptRecord> MemoryAuditLog::ReadReceipts(Transaction& t, const model::ReceiptFilter& filter, uint64_t start_offset,
                                                               uint64_t max_entries) {
  std::vector<model::ReceiptRecord> out;
  const auto&                       tx = TX(t);
  for (const auto* state : {&tx.Committed(), &tx.Writes()}) {
    for (const auto& record : state->receipts) {
      if (out.size() >= max_entries) {
        return out;
      }
      if (record.offset < start_offset || !filter.Matches(record)) {
        continue;
      }
      out.push_back(record);
    }
  }
  return out;
}

Result MemoryAuditLog::AppendBatch(Transaction& t, model::BatchRow& row) {
  auto& tx     = TX(t);
  auto& writes = tx.Writes();
  if (committed_.batch_index.contains(row.batch_id) || writes.batch_index.contains(row.batch_id)) {
    return Result::Err(ErrorCode::AlreadyExists, row.batch_id);
  }

  row.sequence = committed_.batches.size() + writes.batches.size();
  writes.batch_index[row.batch_id] = row.sequence;
  writes.batches.push_back(row);
  return Result::Ok();
}

std::vector<model::BatchRow> MemoryAuditLog::ReadBatches(Transaction& t) {
  const auto&                  tx = TX(t);
  std::vector<model::BatchRow> out(tx.Committed().batches);
  out.insert(out.end(), tx.Writes().batches.begin(), tx.Writes().batches.end());
  return out;
}

} // namespace provgate::db::memory
