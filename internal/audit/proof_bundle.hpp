#pragma once

#include <string>

#include "provgate/v1.hpp"

namespace provgate::audit {

struct BundleCheck {
  bool        valid = false;
  std::string reason;
};

/*
  Offline verification of a proof bundle. Uses only the bundle's contents:

    1. the receipt digest matches its canonical encoding
    2. the receipt signature verifies against a bundled public key that was
       valid at signing time
    3. the inclusion proof is for this receipt and recomputes the batch root
    4. at least `threshold` distinct entities signed the batch root
*/
BundleCheck VerifyProofBundle(const provgate::v1::ProofBundle& bundle);

// Same checks; throws ProofVerificationError with the failing reason.
void CheckProofBundle(const provgate::v1::ProofBundle& bundle);

std::string ToJson(const provgate::v1::ProofBundle& bundle);

// Throws InvalidArgument on malformed input.
provgate::v1::ProofBundle ProofBundleFromJson(const std::string& json);

} // namespace provgate::audit
