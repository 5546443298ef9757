#include "memory_tx.hpp"

namespace provgate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryAuditLog& log) : log_(log), lock_(log.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  auto& state = log_.committed_;
  for (auto& record : writes_.receipts) {
    state.receipt_index[record.receipt_id] = record.offset;
    state.receipts.push_back(std::move(record));
  }
  for (auto& row : writes_.batches) {
    state.batch_index[row.batch_id] = row.sequence;
    state.batches.push_back(std::move(row));
  }
  writes_    = {};
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  writes_      = {};
  rolled_back_ = true;
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace provgate::db::memory
