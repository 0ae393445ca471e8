/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "claims/claims_error.hpp"

namespace ds::claims {
  bool isVerificationFailure(const std::error_code &error) {
    return error == ClaimsError::kVerificationFailed
           || error == ClaimsError::kMalformed
           || error == ClaimsError::kUntrustedIssuer
           || error == ClaimsError::kInvalidSignature
           || error == ClaimsError::kExpired || error == ClaimsError::kRevoked
           || error == ClaimsError::kHolderMismatch;
  }
}  // namespace ds::claims

OUTCOME_CPP_DEFINE_CATEGORY(ds::claims, ClaimsError, e) {
  using E = ds::claims::ClaimsError;
  switch (e) {
    case E::kIssuanceDenied:
      return "ClaimsError: subject is not entitled to requested claims";
    case E::kVerificationFailed:
      return "ClaimsError: verification failed";
    case E::kMalformed:
      return "ClaimsError: malformed presentation";
    case E::kUntrustedIssuer:
      return "ClaimsError: issuer is not trusted";
    case E::kInvalidSignature:
      return "ClaimsError: signature is invalid";
    case E::kExpired:
      return "ClaimsError: claims expired";
    case E::kRevoked:
      return "ClaimsError: credential or token revoked";
    case E::kHolderMismatch:
      return "ClaimsError: presentation subject is not the holder";
    case E::kTokenNotFound:
      return "ClaimsError: token not found";
    case E::kSigningFailed:
      return "ClaimsError: signing failed";
    case E::kInvalidKey:
      return "ClaimsError: invalid signing key";
  }
  return "ClaimsError: unknown error";
}
