#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/trust/trust_layer.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"
#include "merkle_tree.hpp"

namespace provgate::merkle {

struct BatchWindow {
  std::size_t               max_receipts{256};
  std::chrono::milliseconds max_age{60000};
};

struct RootSigning {
  provgate::v1::SignerRole role = provgate::v1::SIGNER_ROLE_PLATFORM_OPERATOR;
  uint32_t                 threshold{1};
  util::BackoffPolicy      retry;
};

/*
  Sealed batch: the tree and its signed record. Never modified after
  construction, shared freely between verifiers.
*/
class SealedBatch {
 public:
  SealedBatch(MerkleTree tree, provgate::v1::BatchRecord record) : tree_(std::move(tree)), record_(std::move(record)) {
  }

  const std::string& Id() const {
    return record_.batch_id();
  }

  const MerkleTree& Tree() const {
    return tree_;
  }

  const provgate::v1::BatchRecord& Record() const {
    return record_;
  }

 private:
  MerkleTree                tree_;
  provgate::v1::BatchRecord record_;
};

/*
  Merkle batcher.

  Collects receipt digests in arrival order into the open batch and seals it
  when the window (count or age) is reached. Sealing builds the tree and
  collects `threshold` root signatures; a batch is only published once the
  threshold is met. If signing fails the receipts stay in the open batch in
  their original order.
*/
class MerkleBatcher {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  MerkleBatcher(std::shared_ptr<trust::TrustLayer> trust, BatchWindow window, RootSigning signing, ClockFn clock = util::Now);

  // False when the digest is already pending or sealed.
  bool Add(const std::string& receipt_digest);

  std::size_t PendingCount() const;
  bool        ShouldSeal() const;

  // Seals when the window is reached; nullptr otherwise.
  std::shared_ptr<const SealedBatch> SealIfDue();

  // Throws InvalidState when no receipt is pending.
  std::shared_ptr<const SealedBatch> SealBatch();

  // nullopt while the receipt is pending or unknown.
  std::optional<provgate::v1::InclusionProof> Prove(const std::string& receipt_digest) const;

  std::shared_ptr<const SealedBatch>              BatchFor(const std::string& receipt_digest) const;
  std::shared_ptr<const SealedBatch>              Find(const std::string& batch_id) const;
  std::vector<std::shared_ptr<const SealedBatch>> Batches() const;

  // Re-registers a batch read back from storage after checking its root.
  void Restore(const provgate::v1::BatchRecord& record);

  // Digest signed for a batch root: commits id, leaf count and root.
  static std::string RootDigest(const std::string& batch_id, uint64_t leaf_count, const std::string& root);

  static bool VerifyRoot(const provgate::v1::BatchRecord& record, const trust::TrustLayer& trust, provgate::v1::SignerRole role);

 private:
  void PublishLocked(std::shared_ptr<const SealedBatch> batch);

  std::shared_ptr<trust::TrustLayer> trust_;
  BatchWindow                        window_;
  RootSigning                        signing_;
  ClockFn                            clock_;

  // serializes SealBatch; mutex_ is never held while signing
  std::mutex seal_mutex_;

  mutable std::mutex              mutex_;
  std::deque<std::string>         pending_;
  std::unordered_set<std::string> known_;
  util::TimePoint                 opened_at_{};

  std::vector<std::shared_ptr<const SealedBatch>>                     batches_;
  std::unordered_map<std::string, std::shared_ptr<const SealedBatch>> by_digest_;
  std::unordered_map<std::string, std::shared_ptr<const SealedBatch>> by_id_;
};

} // namespace provgate::merkle
