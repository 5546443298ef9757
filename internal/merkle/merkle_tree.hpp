#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "provgate/v1.hpp"

namespace provgate::merkle {

/*
  Binary Merkle tree over an ordered list of receipt digests (hex).

    leaf     = H(0x00 || digest bytes)
    interior = H(0x01 || left || right)
    padding  = H(0x02 || "provgate.merkle.empty")

  The leaf level is padded with padding leaves up to the next power of two,
  so every level has an even width and every proof for a tree of n leaves
  has ceil(log2(n)) steps. Hashes are raw 32-byte strings.

  Immutable after construction.
*/
class MerkleTree {
 public:
  explicit MerkleTree(std::vector<std::string> leaf_digests);

  const std::string& Root() const {
    return levels_.back().front();
  }

  std::size_t LeafCount() const {
    return leaves_.size();
  }

  const std::vector<std::string>& Leaves() const {
    return leaves_;
  }

  std::optional<std::size_t> IndexOf(const std::string& leaf_digest) const;

  provgate::v1::InclusionProof Prove(std::size_t index) const;

  // nullopt when the digest is not a leaf of this tree
  std::optional<provgate::v1::InclusionProof> Prove(const std::string& leaf_digest) const;

  /*
    Recomputes the root from proof.leaf_digest and the sibling path and
    compares it with expected_root. Also checks that the step sides agree
    with leaf_index and that the path length matches leaf_count, so a proof
    cannot be replayed at another position.
  */
  static bool Verify(const provgate::v1::InclusionProof& proof, const std::string& expected_root);

  static std::string LeafHash(std::string_view leaf_digest);
  static std::string InteriorHash(std::string_view left, std::string_view right);
  static const std::string& PaddingLeaf();

  // Number of proof steps for a tree with leaf_count leaves.
  static std::size_t Depth(std::size_t leaf_count);

 private:
  std::vector<std::string>              leaves_;
  std::vector<std::vector<std::string>> levels_;
};

} // namespace provgate::merkle
