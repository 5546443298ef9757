#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_audit_log.hpp"

namespace provgate::db::memory {

/*
  Transaction = write set over the committed log.

  The log is append-only, so a transaction never needs a snapshot copy:
  reads see the committed prefix plus this transaction's own appends, and
  Commit() moves the write set onto the committed log. Holding `lock_` for
  the transaction's lifetime serializes writers the way BEGIN IMMEDIATE does
  for SQLite.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryAuditLog& log);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryAuditLog::State& Writes() {
    return writes_;
  }
  const MemoryAuditLog::State& Writes() const {
    return writes_;
  }
  const MemoryAuditLog::State& Committed() const {
    return log_.committed_;
  }

 private:
  MemoryAuditLog&              log_;
  std::unique_lock<std::mutex> lock_;
  MemoryAuditLog::State        writes_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace provgate::db::memory
