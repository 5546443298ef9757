#include "audit_trail.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/crypto/digest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/receipt/receipt_generator.hpp"
#include "internal/util/errors.hpp"

namespace provgate::audit {

using namespace provgate::v1;
using provgate::observability::IntField;
using provgate::observability::StringField;

namespace {

int64_t ToMicros(util::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw std::runtime_error(prefix + ": " + result.message);
  }
}

Receipt ParseReceipt(const db::model::ReceiptRecord& record) {
  Receipt receipt;
  if (!receipt.ParseFromString(record.payload)) {
    throw util::InvalidState("corrupt receipt at offset " + std::to_string(record.offset));
  }
  return receipt;
}

db::model::ReceiptFilter ToFilter(const ReceiptQuery& query) {
  db::model::ReceiptFilter filter;
  filter.operation_id = query.operation_id;
  if (query.stage) filter.stage = static_cast<int>(*query.stage);
  if (query.from) filter.from_us = ToMicros(*query.from);
  if (query.to) filter.to_us = ToMicros(*query.to);
  return filter;
}

} // namespace

// ------------------------------------------------------------
// ReceiptCursor
// ------------------------------------------------------------

ReceiptCursor::ReceiptCursor(std::shared_ptr<db::AuditLog> log, db::model::ReceiptFilter filter, std::size_t page_size)
    : log_(std::move(log)), filter_(std::move(filter)), page_size_(page_size == 0 ? 1 : page_size) {
}

void ReceiptCursor::Fill() {
  auto tx   = log_->Begin();
  auto rows = log_->ReadReceipts(*tx, filter_, next_offset_, page_size_);
  tx->Commit();

  for (auto& row : rows) {
    next_offset_ = row.offset + 1;
    page_.push_back(std::move(row));
  }
}

std::optional<Receipt> ReceiptCursor::Next() {
  if (page_.empty()) {
    Fill();
  }
  if (page_.empty()) {
    return std::nullopt;
  }

  auto record = std::move(page_.front());
  page_.pop_front();
  return ParseReceipt(record);
}

void ReceiptCursor::Reset() {
  page_.clear();
  next_offset_ = 0;
}

// ------------------------------------------------------------
// AuditTrail
// ------------------------------------------------------------

AuditTrail::AuditTrail(std::shared_ptr<db::AuditLog> log, std::shared_ptr<merkle::MerkleBatcher> batcher, std::shared_ptr<trust::TrustLayer> trust)
    : log_(std::move(log)), batcher_(std::move(batcher)), trust_(std::move(trust)) {
  if (!log_ || !batcher_ || !trust_) {
    throw util::InvalidArgument("audit trail requires a log, a batcher and a trust layer");
  }
}

void AuditTrail::Hydrate() {
  std::lock_guard append_lock(append_mutex_);

  std::vector<db::model::BatchRow> rows;
  {
    auto tx = log_->Begin();
    rows    = log_->ReadBatches(*tx);
    tx->Commit();
  }
  for (const auto& row : rows) {
    BatchRecord record;
    if (!record.ParseFromString(row.payload)) {
      throw util::InvalidState("corrupt batch record " + row.batch_id);
    }
    batcher_->Restore(record);
  }

  std::size_t requeued = 0;
  ReceiptCursor cursor(log_, {}, 256);
  while (auto receipt = cursor.Next()) {
    if (batcher_->Add(receipt->digest())) {
      ++requeued;
    }
  }

  PROVGATE_LOG_INFO("Audit trail hydrated", {IntField("batches", static_cast<std::int64_t>(rows.size())),
                                             IntField("pending_receipts", static_cast<std::int64_t>(requeued))});
}

bool AuditTrail::Append(const Receipt& receipt) {
  if (!receipt::ReceiptGenerator::CheckDigest(receipt)) {
    throw util::InvalidArgument("receipt " + receipt.receipt_id() + " digest does not match its contents");
  }

  db::model::ReceiptRecord record;
  record.receipt_id   = receipt.receipt_id();
  record.operation_id = receipt.operation_id();
  record.stage        = static_cast<int>(receipt.stage());
  record.issued_at_us = ToMicros(util::FromProto(receipt.issued_at()));
  record.digest       = receipt.digest();
  record.payload      = receipt.SerializeAsString();

  {
    std::lock_guard lock(append_mutex_);

    auto tx     = log_->Begin();
    auto result = log_->AppendReceipt(*tx, record);
    if (result.code == db::ErrorCode::AlreadyExists) {
      tx->Rollback();
      PROVGATE_LOG_DEBUG("Duplicate receipt ignored", {StringField("receipt_id", receipt.receipt_id())});
      return false;
    }
    ThrowIfError(result, "append receipt");
    tx->Commit();

    batcher_->Add(receipt.digest());
  }

  // the receipt is durable from here on; batching problems must not undo that
  try {
    SealIfDue();
  } catch (const util::SigningUnavailableError& e) {
    // receipts stay in the open batch; the next append or SealPending retries
    PROVGATE_LOG_ERROR("Batch sealing deferred", {StringField("error", e.what())});
  } catch (const std::exception& e) {
    PROVGATE_LOG_ERROR("Batch sealing failed after append", {StringField("receipt_id", receipt.receipt_id()), StringField("error", e.what())});
  }
  return true;
}

std::shared_ptr<const merkle::SealedBatch> AuditTrail::SealIfDue() {
  std::lock_guard lock(seal_mutex_);
  PersistOutstandingLocked();

  auto batch = batcher_->SealIfDue();
  if (batch) {
    PersistLocked(batch);
  }
  return batch;
}

std::shared_ptr<const merkle::SealedBatch> AuditTrail::SealPending() {
  std::lock_guard lock(seal_mutex_);
  PersistOutstandingLocked();

  if (batcher_->PendingCount() == 0) {
    return nullptr;
  }
  auto batch = batcher_->SealBatch();
  PersistLocked(batch);
  return batch;
}

std::size_t AuditTrail::UnpersistedBatches() const {
  std::lock_guard lock(seal_mutex_);
  return unpersisted_.size();
}

void AuditTrail::PersistLocked(const std::shared_ptr<const merkle::SealedBatch>& batch) {
  try {
    Persist(*batch);
  } catch (const std::exception& e) {
    // already published in memory; written on the next seal
    unpersisted_.push_back(batch);
    PROVGATE_LOG_ERROR("Sealed batch not persisted", {StringField("batch_id", batch->Id()), StringField("error", e.what())});
    throw;
  }
}

void AuditTrail::PersistOutstandingLocked() {
  while (!unpersisted_.empty()) {
    Persist(*unpersisted_.front());
    PROVGATE_LOG_INFO("Persisted deferred batch", {StringField("batch_id", unpersisted_.front()->Id())});
    unpersisted_.pop_front();
  }
}

void AuditTrail::Persist(const merkle::SealedBatch& batch) {
  db::model::BatchRow row;
  row.batch_id     = batch.Id();
  row.sealed_at_us = ToMicros(util::FromProto(batch.Record().sealed_at()));
  row.payload      = batch.Record().SerializeAsString();

  auto tx = log_->Begin();
  ThrowIfError(log_->AppendBatch(*tx, row), "append batch");
  tx->Commit();
}

std::optional<Receipt> AuditTrail::GetReceipt(const std::string& receipt_id) const {
  auto tx     = log_->Begin();
  auto record = log_->GetReceipt(*tx, receipt_id);
  tx->Commit();
  if (!record) {
    return std::nullopt;
  }
  return ParseReceipt(*record);
}

ReceiptCursor AuditTrail::Query(const ReceiptQuery& query, std::size_t page_size) const {
  return ReceiptCursor(log_, ToFilter(query), page_size);
}

ProofBundle AuditTrail::BundleFor(const Receipt& receipt) const {
  auto batch = batcher_->BatchFor(receipt.digest());
  if (!batch) {
    throw util::NotFound("receipt " + receipt.receipt_id() + " is not in a sealed batch");
  }

  const auto& record = batch->Record();

  ProofBundle bundle;
  *bundle.mutable_receipt() = receipt;
  *bundle.mutable_proof()   = batch->Tree().Prove(*batch->Tree().IndexOf(receipt.digest()));
  bundle.set_batch_id(record.batch_id());
  bundle.set_batch_root(record.root());
  bundle.set_threshold(record.threshold());

  std::vector<Signature> signatures{receipt.signature()};
  for (const auto& signature : record.root_signatures()) {
    *bundle.add_root_signatures() = signature;
    signatures.push_back(signature);
  }
  for (auto& key : trust_->PublicKeysFor(signatures)) {
    *bundle.add_signer_keys() = std::move(key);
  }
  return bundle;
}

std::vector<ProofBundle> AuditTrail::ExportProofBundle(const std::string& operation_id) {
  ReceiptQuery query;
  query.operation_id = operation_id;

  std::vector<Receipt> receipts;
  auto                 cursor = Query(query);
  while (auto receipt = cursor.Next()) {
    receipts.push_back(std::move(*receipt));
  }
  if (receipts.empty()) {
    throw util::NotFound("no receipts for operation " + operation_id);
  }

  auto unbatched = [&] {
    for (const auto& receipt : receipts) {
      if (!batcher_->BatchFor(receipt.digest())) return true;
    }
    return false;
  };
  while (unbatched() && SealPending()) {
  }

  std::vector<ProofBundle> bundles;
  bundles.reserve(receipts.size());
  for (const auto& receipt : receipts) {
    bundles.push_back(BundleFor(receipt));
  }

  PROVGATE_LOG_INFO("Exported proof bundles", {StringField("operation_id", operation_id), IntField("bundles", static_cast<std::int64_t>(bundles.size()))});
  return bundles;
}

} // namespace provgate::audit
