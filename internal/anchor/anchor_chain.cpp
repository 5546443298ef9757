#include "anchor_chain.hpp"

#include "internal/crypto/canonical.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/model/stage.hpp"
#include "internal/util/errors.hpp"

namespace provgate::anchor {

using provgate::v1::Stage;

namespace {

constexpr std::size_t kNonceSize = 16;

std::string DigestOf(const std::string& value) {
  return crypto::Sha256Hex(value);
}

} // namespace

AnchorChain::AnchorChain(std::string lifecycle_id, std::string_view root_secret) : lifecycle_id_(std::move(lifecycle_id)) {
  if (root_secret.empty()) {
    throw util::InvalidArgument("anchor chain requires a non-empty root secret");
  }

  crypto::CanonicalWriter info("provgate.anchor.root");
  info.Bytes(1, lifecycle_id_);

  root_.lifecycle_id = lifecycle_id_;
  root_.value        = crypto::HmacSha256(root_secret, info.Encoded());
  root_.digest       = DigestOf(root_.value);
  root_.created_at   = util::Now();
}

std::string AnchorChain::DeriveNonce(const Anchor& parent, Stage stage, std::string_view salt) {
  crypto::CanonicalWriter info("provgate.anchor.nonce");
  info.Int(1, stage).Bytes(2, salt);
  return crypto::HmacSha256(parent.value, info.Encoded()).substr(0, kNonceSize);
}

Anchor AnchorChain::DeriveChild(const Anchor& parent, Stage stage, std::string_view salt, std::string_view nonce) {
  crypto::CanonicalWriter info("provgate.anchor.v1");
  info.Int(1, stage).Bytes(2, salt).Bytes(3, nonce);

  Anchor child;
  child.lifecycle_id  = parent.lifecycle_id;
  child.stage         = stage;
  child.value         = crypto::HmacSha256(parent.value, info.Encoded());
  child.digest        = DigestOf(child.value);
  child.parent_digest = parent.digest;
  child.salt          = std::string(salt);
  child.nonce         = std::string(nonce);
  child.created_at    = util::Now();
  return child;
}

const Anchor* AnchorChain::ExpectedParentLocked(Stage stage) const {
  const auto previous = model::PreviousStage(stage);
  if (previous == provgate::v1::STAGE_UNSPECIFIED) {
    return &root_;
  }
  auto it = anchors_.find(previous);
  return it == anchors_.end() ? nullptr : &it->second;
}

Anchor AnchorChain::DeriveLocked(const Anchor& parent, Stage stage, std::string_view salt) {
  if (auto existing = anchors_.find(stage); existing != anchors_.end()) {
    if (existing->second.salt != salt) {
      throw util::AlreadyExists("stage " + model::StageName(stage) + " already anchored for lifecycle " + lifecycle_id_);
    }
    return existing->second;
  }

  auto child = DeriveChild(parent, stage, salt, DeriveNonce(parent, stage, salt));
  anchors_.emplace(stage, child);
  return child;
}

Anchor AnchorChain::Derive(const Anchor& parent, Stage stage, std::string_view salt) {
  if (!model::IsLifecycleStage(stage)) {
    throw util::InvalidArgument("cannot anchor unspecified stage");
  }

  std::lock_guard lock(mutex_);

  const Anchor* expected = ExpectedParentLocked(stage);
  if (!expected) {
    throw util::InvalidParentError("stage " + model::StageName(model::PreviousStage(stage)) + " is not anchored yet for lifecycle " + lifecycle_id_);
  }
  if (parent.lifecycle_id != lifecycle_id_ || !crypto::Equal(parent.digest, expected->digest) || !crypto::Equal(parent.value, expected->value)) {
    throw util::InvalidParentError("parent anchor does not match the " + (expected->stage == provgate::v1::STAGE_UNSPECIFIED ? std::string("root") : model::StageName(expected->stage)) +
                                   " anchor of lifecycle " + lifecycle_id_);
  }

  return DeriveLocked(*expected, stage, salt);
}

Anchor AnchorChain::Derive(Stage stage, std::string_view salt) {
  if (!model::IsLifecycleStage(stage)) {
    throw util::InvalidArgument("cannot anchor unspecified stage");
  }

  std::lock_guard lock(mutex_);

  const Anchor* expected = ExpectedParentLocked(stage);
  if (!expected) {
    throw util::InvalidParentError("stage " + model::StageName(model::PreviousStage(stage)) + " is not anchored yet for lifecycle " + lifecycle_id_);
  }
  return DeriveLocked(*expected, stage, salt);
}

std::optional<Anchor> AnchorChain::Get(Stage stage) const {
  std::lock_guard lock(mutex_);
  auto            it = anchors_.find(stage);
  if (it == anchors_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace provgate::anchor
