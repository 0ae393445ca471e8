/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::negotiation {

  enum class NegotiationError {
    kInvalidStateTransition = 1,
    kPolicyDenied,
    kOfferLimitExceeded,
    kWrongRole,
    kAgreementNotSigned,
    kAgreementMismatch,
    kMalformedMessage,
  };

}  // namespace ds::negotiation

OUTCOME_HPP_DECLARE_ERROR(ds::negotiation, NegotiationError);
