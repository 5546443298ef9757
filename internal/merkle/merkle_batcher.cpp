#include "merkle_batcher.hpp"

#include <algorithm>

#include "internal/crypto/canonical.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace provgate::merkle {

using namespace provgate::v1;
using provgate::observability::IntField;
using provgate::observability::StringField;

MerkleBatcher::MerkleBatcher(std::shared_ptr<trust::TrustLayer> trust, BatchWindow window, RootSigning signing, ClockFn clock)
    : trust_(std::move(trust)), window_(window), signing_(signing), clock_(std::move(clock)) {
  if (!trust_) {
    throw util::InvalidArgument("merkle batcher requires a trust layer");
  }
  if (window_.max_receipts == 0) {
    throw util::InvalidArgument("batch window must allow at least one receipt");
  }
  if (signing_.threshold == 0) {
    throw util::InvalidArgument("batch root threshold must be at least 1");
  }
}

std::string MerkleBatcher::RootDigest(const std::string& batch_id, uint64_t leaf_count, const std::string& root) {
  crypto::CanonicalWriter w("provgate.batch.v1");
  w.Bytes(1, batch_id).Uint(2, leaf_count).Bytes(3, root);
  return w.Digest();
}

bool MerkleBatcher::Add(const std::string& receipt_digest) {
  std::lock_guard lock(mutex_);
  if (!known_.insert(receipt_digest).second) {
    return false;
  }
  if (pending_.empty()) {
    opened_at_ = clock_();
  }
  pending_.push_back(receipt_digest);
  return true;
}

std::size_t MerkleBatcher::PendingCount() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

bool MerkleBatcher::ShouldSeal() const {
  std::lock_guard lock(mutex_);
  if (pending_.empty()) {
    return false;
  }
  return pending_.size() >= window_.max_receipts || clock_() - opened_at_ >= window_.max_age;
}

std::shared_ptr<const SealedBatch> MerkleBatcher::SealIfDue() {
  if (!ShouldSeal()) {
    return nullptr;
  }
  return SealBatch();
}

std::shared_ptr<const SealedBatch> MerkleBatcher::SealBatch() {
  std::lock_guard seal_lock(seal_mutex_);

  std::vector<std::string> leaves;
  util::TimePoint          opened_at;
  {
    std::lock_guard lock(mutex_);
    if (pending_.empty()) {
      throw util::InvalidState("no pending receipts to seal");
    }
    const auto count = std::min(pending_.size(), window_.max_receipts);
    leaves.assign(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(count));
    opened_at = opened_at_;
  }

  MerkleTree tree(leaves);

  BatchRecord record;
  record.set_batch_id(util::NewId());
  record.set_root(tree.Root());
  record.set_leaf_count(tree.LeafCount());
  for (const auto& leaf : leaves) {
    record.add_leaves(leaf);
  }
  *record.mutable_opened_at() = util::ToProto(opened_at);
  record.set_threshold(signing_.threshold);

  const auto digest = RootDigest(record.batch_id(), record.leaf_count(), record.root());
  const auto signatures = util::RetryWithBackoff<util::SigningUnavailableError>(
      signing_.retry, [&] { return trust_->SignThreshold(digest, signing_.role, signing_.threshold); },
      [&](uint32_t attempt, const util::SigningUnavailableError& e) {
        PROVGATE_LOG_WARN("Batch root signing failed, retrying",
                          {StringField("batch_id", record.batch_id()), IntField("attempt", attempt), StringField("error", e.what())});
      });
  for (const auto& signature : signatures) {
    *record.add_root_signatures() = signature;
  }
  *record.mutable_sealed_at() = util::ToProto(clock_());

  auto batch = std::make_shared<const SealedBatch>(std::move(tree), std::move(record));
  {
    std::lock_guard lock(mutex_);
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(leaves.size()));
    if (!pending_.empty()) {
      opened_at_ = clock_();
    }
    PublishLocked(batch);
  }

  PROVGATE_LOG_INFO("Sealed batch", {StringField("batch_id", batch->Id()), IntField("leaf_count", static_cast<std::int64_t>(leaves.size())),
                                     StringField("root", crypto::ToHex(batch->Record().root()))});
  return batch;
}

void MerkleBatcher::PublishLocked(std::shared_ptr<const SealedBatch> batch) {
  for (const auto& leaf : batch->Tree().Leaves()) {
    by_digest_[leaf] = batch;
  }
  by_id_[batch->Id()] = batch;
  batches_.push_back(std::move(batch));
}

void MerkleBatcher::Restore(const BatchRecord& record) {
  std::vector<std::string> leaves(record.leaves().begin(), record.leaves().end());
  if (leaves.size() != record.leaf_count()) {
    throw util::ProofVerificationError("batch " + record.batch_id() + " leaf count mismatch");
  }

  MerkleTree tree(std::move(leaves));
  if (!crypto::Equal(tree.Root(), record.root())) {
    throw util::ProofVerificationError("batch " + record.batch_id() + " root does not match its leaves");
  }

  auto            batch = std::make_shared<const SealedBatch>(std::move(tree), record);
  std::lock_guard lock(mutex_);
  if (by_id_.contains(record.batch_id())) {
    throw util::AlreadyExists("batch already restored: " + record.batch_id());
  }
  for (const auto& leaf : record.leaves()) {
    known_.insert(leaf);
  }
  PublishLocked(std::move(batch));
}

std::optional<InclusionProof> MerkleBatcher::Prove(const std::string& receipt_digest) const {
  auto batch = BatchFor(receipt_digest);
  if (!batch) {
    return std::nullopt;
  }
  return batch->Tree().Prove(receipt_digest);
}

std::shared_ptr<const SealedBatch> MerkleBatcher::BatchFor(const std::string& receipt_digest) const {
  std::lock_guard lock(mutex_);
  auto            it = by_digest_.find(receipt_digest);
  return it == by_digest_.end() ? nullptr : it->second;
}

std::shared_ptr<const SealedBatch> MerkleBatcher::Find(const std::string& batch_id) const {
  std::lock_guard lock(mutex_);
  auto            it = by_id_.find(batch_id);
  return it == by_id_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const SealedBatch>> MerkleBatcher::Batches() const {
  std::lock_guard lock(mutex_);
  return batches_;
}

bool MerkleBatcher::VerifyRoot(const BatchRecord& record, const trust::TrustLayer& trust, SignerRole role) {
  const auto                   digest = RootDigest(record.batch_id(), record.leaf_count(), record.root());
  std::vector<Signature> signatures(record.root_signatures().begin(), record.root_signatures().end());
  return trust.VerifyThreshold(digest, signatures, role, record.threshold());
}

} // namespace provgate::merkle
