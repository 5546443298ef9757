#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "anchor.hpp"

namespace provgate::anchor {

/*
  Anchor chain for one lifecycle instance.

  Dataset -> Model -> Training -> Deployment -> Inference, each anchor keyed
  by its parent:

    root  = HMAC(root_secret, "provgate.anchor.root" || lifecycle_id)
    nonce = HMAC(parent.value, "provgate.anchor.nonce" || stage || salt)[0..16)
    child = HMAC(parent.value, "provgate.anchor.v1" || stage || salt || nonce)

  Derivation is deterministic: anyone holding the parent and the salt can
  reproduce the child.

  The chain is an exclusive resource: derivations are serialized so two
  concurrent callers can never produce divergent histories for one stage.
*/
class AnchorChain {
 public:
  AnchorChain(std::string lifecycle_id, std::string_view root_secret);

  AnchorChain(const AnchorChain&)            = delete;
  AnchorChain& operator=(const AnchorChain&) = delete;

  const std::string& LifecycleId() const {
    return lifecycle_id_;
  }

  const Anchor& Root() const {
    return root_;
  }

  /*
    Derives the anchor for `stage` from `parent`.

    Throws InvalidParentError if `parent` is not the stored anchor of the
    previous stage (or the root for STAGE_DATASET). Deriving an already
    anchored stage with the same salt returns the stored anchor; a different
    salt throws AlreadyExists.
  */
  Anchor Derive(const Anchor& parent, provgate::v1::Stage stage, std::string_view salt);

  // Derives from the stored previous-stage anchor.
  Anchor Derive(provgate::v1::Stage stage, std::string_view salt);

  std::optional<Anchor> Get(provgate::v1::Stage stage) const;

  static std::string DeriveNonce(const Anchor& parent, provgate::v1::Stage stage, std::string_view salt);

  // Pure derivation; the same inputs always produce the same anchor value.
  static Anchor DeriveChild(const Anchor& parent, provgate::v1::Stage stage, std::string_view salt, std::string_view nonce);

 private:
  const Anchor* ExpectedParentLocked(provgate::v1::Stage stage) const;
  Anchor        DeriveLocked(const Anchor& parent, provgate::v1::Stage stage, std::string_view salt);

  std::string lifecycle_id_;
  Anchor      root_;

  mutable std::mutex                     mutex_;
  std::map<provgate::v1::Stage, Anchor>  anchors_;
};

} // namespace provgate::anchor
