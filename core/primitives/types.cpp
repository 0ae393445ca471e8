/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/types.hpp"

namespace ds::primitives {

  std::string toString(TransferType type) {
    switch (type) {
      case TransferType::kPush:
        return "PUSH";
      case TransferType::kPull:
        return "PULL";
    }
    return "UNKNOWN";
  }

  std::string toString(TerminationReason reason) {
    switch (reason) {
      case TerminationReason::kNone:
        return "None";
      case TerminationReason::kCompleted:
        return "Completed";
      case TerminationReason::kPolicyDenied:
        return "PolicyDenied";
      case TerminationReason::kOfferLimitExceeded:
        return "OfferLimitExceeded";
      case TerminationReason::kVerificationFailed:
        return "VerificationFailed";
      case TerminationReason::kCounterpartyUnreachable:
        return "CounterpartyUnreachable";
      case TerminationReason::kCounterpartyAbort:
        return "CounterpartyAbort";
      case TerminationReason::kTimeout:
        return "Timeout";
      case TerminationReason::kPolicyViolation:
        return "PolicyViolation";
      case TerminationReason::kManual:
        return "Manual";
      case TerminationReason::kSystemError:
        return "SystemError";
    }
    return "Unknown";
  }
}  // namespace ds::primitives
