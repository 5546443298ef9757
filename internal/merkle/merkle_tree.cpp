#include "merkle_tree.hpp"

#include <stdexcept>

#include "internal/crypto/digest.hpp"
#include "internal/util/errors.hpp"

namespace provgate::merkle {

using namespace provgate::v1;

namespace {

constexpr char kLeafPrefix     = 0x00;
constexpr char kInteriorPrefix = 0x01;
constexpr char kPaddingPrefix  = 0x02;

} // namespace

std::string MerkleTree::LeafHash(std::string_view leaf_digest) {
  const auto raw = crypto::FromHex(leaf_digest);
  if (raw.size() != crypto::kDigestSize) {
    throw std::invalid_argument("leaf digest must be 32 bytes");
  }
  std::string buf(1, kLeafPrefix);
  buf += raw;
  return crypto::Sha256(buf);
}

std::string MerkleTree::InteriorHash(std::string_view left, std::string_view right) {
  std::string buf(1, kInteriorPrefix);
  buf.append(left.data(), left.size());
  buf.append(right.data(), right.size());
  return crypto::Sha256(buf);
}

const std::string& MerkleTree::PaddingLeaf() {
  static const std::string padding = crypto::Sha256(std::string(1, kPaddingPrefix) + "provgate.merkle.empty");
  return padding;
}

std::size_t MerkleTree::Depth(std::size_t leaf_count) {
  std::size_t depth = 0;
  std::size_t width = 1;
  while (width < leaf_count) {
    width <<= 1;
    ++depth;
  }
  return depth;
}

MerkleTree::MerkleTree(std::vector<std::string> leaf_digests) : leaves_(std::move(leaf_digests)) {
  if (leaves_.empty()) {
    throw util::InvalidArgument("merkle tree requires at least one leaf");
  }

  const std::size_t width = std::size_t{1} << Depth(leaves_.size());

  std::vector<std::string> level;
  level.reserve(width);
  for (const auto& digest : leaves_) {
    try {
      level.push_back(LeafHash(digest));
    } catch (const std::invalid_argument&) {
      throw util::InvalidArgument("leaf is not a hex digest: " + digest);
    }
  }
  level.resize(width, PaddingLeaf());
  levels_.push_back(std::move(level));

  while (levels_.back().size() > 1) {
    const auto&              below = levels_.back();
    std::vector<std::string> above;
    above.reserve(below.size() / 2);
    for (std::size_t i = 0; i < below.size(); i += 2) {
      above.push_back(InteriorHash(below[i], below[i + 1]));
    }
    levels_.push_back(std::move(above));
  }
}

std::optional<std::size_t> MerkleTree::IndexOf(const std::string& leaf_digest) const {
  for (std::size_t i = 0; i < leaves_.size(); ++i) {
    if (leaves_[i] == leaf_digest) return i;
  }
  return std::nullopt;
}

InclusionProof MerkleTree::Prove(std::size_t index) const {
  if (index >= leaves_.size()) {
    throw util::NotFound("leaf index out of range: " + std::to_string(index));
  }

  InclusionProof proof;
  proof.set_leaf_digest(leaves_[index]);
  proof.set_leaf_index(index);
  proof.set_leaf_count(leaves_.size());
  proof.set_root(Root());

  std::size_t position = index;
  for (std::size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
    const bool is_right = (position & 1) != 0;
    auto*      step     = proof.add_steps();
    step->set_sibling(levels_[depth][is_right ? position - 1 : position + 1]);
    step->set_side(is_right ? SIBLING_SIDE_LEFT : SIBLING_SIDE_RIGHT);
    position >>= 1;
  }
  return proof;
}

std::optional<InclusionProof> MerkleTree::Prove(const std::string& leaf_digest) const {
  const auto index = IndexOf(leaf_digest);
  if (!index) {
    return std::nullopt;
  }
  return Prove(*index);
}

bool MerkleTree::Verify(const InclusionProof& proof, const std::string& expected_root) {
  if (proof.leaf_count() == 0 || proof.leaf_index() >= proof.leaf_count()) {
    return false;
  }
  if (static_cast<std::size_t>(proof.steps_size()) != Depth(proof.leaf_count())) {
    return false;
  }

  std::string current;
  try {
    current = LeafHash(proof.leaf_digest());
  } catch (const std::invalid_argument&) {
    return false;
  }

  uint64_t position = proof.leaf_index();
  for (const auto& step : proof.steps()) {
    const auto expected_side = (position & 1) != 0 ? SIBLING_SIDE_LEFT : SIBLING_SIDE_RIGHT;
    if (step.side() != expected_side || step.sibling().size() != crypto::kDigestSize) {
      return false;
    }
    current = step.side() == SIBLING_SIDE_LEFT ? InteriorHash(step.sibling(), current) : InteriorHash(current, step.sibling());
    position >>= 1;
  }

  return crypto::Equal(current, expected_root);
}

} // namespace provgate::merkle
