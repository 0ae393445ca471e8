/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "negotiation/negotiation_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::negotiation, NegotiationError, e) {
  using E = ds::negotiation::NegotiationError;
  switch (e) {
    case E::kInvalidStateTransition:
      return "NegotiationError: invalid negotiation state transition";
    case E::kPolicyDenied:
      return "NegotiationError: policy denied the request";
    case E::kOfferLimitExceeded:
      return "NegotiationError: maximum number of offers exceeded";
    case E::kWrongRole:
      return "NegotiationError: operation is not allowed for the role";
    case E::kAgreementNotSigned:
      return "NegotiationError: agreement lacks signature of a party";
    case E::kAgreementMismatch:
      return "NegotiationError: agreement differs from negotiated terms";
    case E::kMalformedMessage:
      return "NegotiationError: message lacks required payload";
  }
  return "NegotiationError: unknown error";
}
