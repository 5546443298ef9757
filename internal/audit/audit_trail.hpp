#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/audit_log.hpp"
#include "internal/merkle/merkle_batcher.hpp"
#include "internal/trust/trust_layer.hpp"
#include "internal/util/time.hpp"
#include "provgate/v1.hpp"

namespace provgate::audit {

struct ReceiptQuery {
  std::optional<std::string>         operation_id;
  std::optional<provgate::v1::Stage> stage;
  std::optional<util::TimePoint>     from;
  std::optional<util::TimePoint>     to;
};

/*
  Lazy, restartable sequence over the audit log.

  Reads one page per storage transaction and never holds a transaction
  between calls. Receipts appended after the cursor was created are seen
  when the cursor reaches them.
*/
class ReceiptCursor {
 public:
  ReceiptCursor(std::shared_ptr<db::AuditLog> log, db::model::ReceiptFilter filter, std::size_t page_size);

  std::optional<provgate::v1::Receipt> Next();

  // Starts over from the first matching receipt.
  void Reset();

 private:
  void Fill();

  std::shared_ptr<db::AuditLog>        log_;
  db::model::ReceiptFilter             filter_;
  std::size_t                          page_size_;
  uint64_t                             next_offset_ = 0;
  std::deque<db::model::ReceiptRecord> page_;
};

/*
  Audit trail compiler.

  Owns the append path: every receipt is written to the audit log and then
  queued into the Merkle batcher, in the same order. Sealed batches are
  written back to the log so proofs survive a restart (see Hydrate).
*/
class AuditTrail {
 public:
  AuditTrail(std::shared_ptr<db::AuditLog> log, std::shared_ptr<merkle::MerkleBatcher> batcher, std::shared_ptr<trust::TrustLayer> trust);

  // Restores sealed batches and re-queues unbatched receipts from the log.
  void Hydrate();

  /*
    Appends a sealed receipt. Returns false when the receipt id is already in
    the log (no second leaf is queued). Throws InvalidArgument for a receipt
    whose digest does not match its contents.
  */
  bool Append(const provgate::v1::Receipt& receipt);

  // Seals the open batch now. nullptr when nothing is pending.
  std::shared_ptr<const merkle::SealedBatch> SealPending();

  // Seals the open batch once its size or age limit is reached.
  std::shared_ptr<const merkle::SealedBatch> SealIfDue();

  std::optional<provgate::v1::Receipt> GetReceipt(const std::string& receipt_id) const;

  ReceiptCursor Query(const ReceiptQuery& query, std::size_t page_size = 128) const;

  /*
    One bundle per receipt of the operation, in append order. Receipts still
    in the open batch force a seal first. Throws NotFound for an unknown
    operation.
  */
  std::vector<provgate::v1::ProofBundle> ExportProofBundle(const std::string& operation_id);

  provgate::v1::ProofBundle BundleFor(const provgate::v1::Receipt& receipt) const;

  // Sealed batches whose log write failed; retried before the next seal.
  std::size_t UnpersistedBatches() const;

 private:
  void Persist(const merkle::SealedBatch& batch);
  void PersistLocked(const std::shared_ptr<const merkle::SealedBatch>& batch);
  void PersistOutstandingLocked();

  std::shared_ptr<db::AuditLog>          log_;
  std::shared_ptr<merkle::MerkleBatcher> batcher_;
  std::shared_ptr<trust::TrustLayer>     trust_;

  // log order == leaf order
  std::mutex append_mutex_;
  // seal order == batch row order
  mutable std::mutex                                     seal_mutex_;
  std::deque<std::shared_ptr<const merkle::SealedBatch>> unpersisted_;
};

} // namespace provgate::audit
