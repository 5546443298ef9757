#include "proof_bundle.hpp"

#include <google/protobuf/util/json_util.h>

#include <set>
#include <stdexcept>

#include "internal/crypto/digest.hpp"
#include "internal/merkle/merkle_batcher.hpp"
#include "internal/merkle/merkle_tree.hpp"
#include "internal/receipt/receipt_generator.hpp"
#include "internal/trust/trust_layer.hpp"
#include "internal/util/errors.hpp"

namespace provgate::audit {

using namespace provgate::v1;

namespace {

const PublicKeyRecord* FindKey(const ProofBundle& bundle, const Signature& signature) {
  for (const auto& key : bundle.signer_keys()) {
    if (key.entity_id() == signature.entity_id() && key.key_id() == signature.key_id()) {
      return &key;
    }
  }
  return nullptr;
}

BundleCheck Fail(std::string reason) {
  return {false, std::move(reason)};
}

} // namespace

BundleCheck VerifyProofBundle(const ProofBundle& bundle) {
  const auto& receipt = bundle.receipt();
  if (!receipt::ReceiptGenerator::CheckDigest(receipt)) {
    return Fail("receipt digest does not match its contents");
  }

  if (!receipt.has_signature()) {
    return Fail("receipt is unsigned");
  }
  const auto* receipt_key = FindKey(bundle, receipt.signature());
  if (!receipt_key) {
    return Fail("no public key for receipt signer " + receipt.signature().entity_id());
  }
  if (!trust::TrustLayer::VerifyWithKey(*receipt_key, crypto::FromHex(receipt.digest()), receipt.signature())) {
    return Fail("receipt signature is invalid");
  }

  const auto& proof = bundle.proof();
  if (proof.leaf_digest() != receipt.digest()) {
    return Fail("inclusion proof is for another receipt");
  }
  if (proof.root() != bundle.batch_root()) {
    return Fail("inclusion proof root differs from the batch root");
  }
  if (!merkle::MerkleTree::Verify(proof, bundle.batch_root())) {
    return Fail("inclusion proof does not recompute the batch root");
  }

  if (bundle.threshold() == 0) {
    return Fail("batch root threshold is zero");
  }
  const auto root_digest = merkle::MerkleBatcher::RootDigest(bundle.batch_id(), proof.leaf_count(), bundle.batch_root());

  std::set<std::string> signers;
  for (const auto& signature : bundle.root_signatures()) {
    const auto* key = FindKey(bundle, signature);
    if (key && trust::TrustLayer::VerifyWithKey(*key, root_digest, signature)) {
      signers.insert(signature.entity_id());
    }
  }
  if (signers.size() < bundle.threshold()) {
    return Fail("batch root has " + std::to_string(signers.size()) + " valid signatures, " + std::to_string(bundle.threshold()) + " required");
  }

  return {true, {}};
}

void CheckProofBundle(const ProofBundle& bundle) {
  auto result = VerifyProofBundle(bundle);
  if (!result.valid) {
    throw util::ProofVerificationError(result.reason);
  }
}

std::string ToJson(const ProofBundle& bundle) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(bundle, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("proof bundle to json failed: " + status.ToString());
  }
  return json;
}

ProofBundle ProofBundleFromJson(const std::string& json) {
  ProofBundle bundle;
  auto        status = google::protobuf::util::JsonStringToMessage(json, &bundle);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid proof bundle json: " + status.ToString());
  }
  return bundle;
}

} // namespace provgate::audit
