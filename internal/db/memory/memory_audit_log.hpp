#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/audit_log.hpp"

namespace provgate::db::memory {

class MemoryTransaction;

class MemoryAuditLog final : public db::AuditLog {
public:
  MemoryAuditLog();

  std::unique_ptr<Transaction> Begin() override;

  Result AppendReceipt(Transaction&, model::ReceiptRecord&) override;
  std::optional<model::ReceiptRecord> GetReceipt(Transaction&, const std::string&) override;
  std::vector<model::ReceiptRecord> ReadReceipts(Transaction&, const model::ReceiptFilter&, uint64_t start_offset,
                                                 uint64_t max_entries) override;

  Result AppendBatch(Transaction&, model::BatchRow&) override;
  std::vector<model::BatchRow> ReadBatches(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::vector<model::ReceiptRecord>         receipts;
    std::unordered_map<std::string, uint64_t> receipt_index;
    std::vector<model::BatchRow>              batches;
    std::unordered_map<std::string, uint64_t> batch_index;
  };

  // caller holds mutex_
  bool HasReceiptLocked(const MemoryTransaction& tx, const std::string& receipt_id) const;

  std::mutex mutex_;
  State      committed_;
};

}
