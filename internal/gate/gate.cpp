#include "gate.hpp"

#include <algorithm>
#include <tuple>

#include "internal/crypto/canonical.hpp"
#include "internal/crypto/digest.hpp"

namespace provgate::gate {

std::string OperationContext::EvidenceDigest() const {
  std::vector<const EvidenceRef*> sorted;
  sorted.reserve(evidence.size());
  for (const auto& ref : evidence) {
    sorted.push_back(&ref);
  }
  std::sort(sorted.begin(), sorted.end(), [](const EvidenceRef* a, const EvidenceRef* b) {
    return std::tie(a->uri, a->digest, a->media_type) < std::tie(b->uri, b->digest, b->media_type);
  });

  crypto::CanonicalWriter w("provgate.evidence.v1");
  w.Uint(1, sorted.size());
  for (const auto* ref : sorted) {
    w.Bytes(2, ref->uri).Bytes(3, ref->digest).Bytes(4, ref->media_type);
  }
  return crypto::ToHex(w.Digest());
}

} // namespace provgate::gate
