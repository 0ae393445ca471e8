/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::claims {

  /**
   * @brief Claims authority errors. Every code except kIssuanceDenied,
   * kTokenNotFound, kSigningFailed and kInvalidKey means the verification failed.
   */
  enum class ClaimsError {
    kIssuanceDenied = 1,
    kVerificationFailed,
    kMalformed,
    kUntrustedIssuer,
    kInvalidSignature,
    kExpired,
    kRevoked,
    kHolderMismatch,
    kTokenNotFound,
    kSigningFailed,
    kInvalidKey,
  };

  /// True if the error is one of verification failures
  bool isVerificationFailure(const std::error_code &error);

}  // namespace ds::claims

OUTCOME_HPP_DECLARE_ERROR(ds::claims, ClaimsError);
