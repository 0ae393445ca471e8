/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "negotiation/types.hpp"

namespace ds::negotiation {
  std::string toString(NegotiationState state) {
    switch (state) {
      case NegotiationState::kRequested:
        return "REQUESTED";
      case NegotiationState::kOffered:
        return "OFFERED";
      case NegotiationState::kAccepted:
        return "ACCEPTED";
      case NegotiationState::kDeclined:
        return "DECLINED";
      case NegotiationState::kAgreed:
        return "AGREED";
      case NegotiationState::kVerified:
        return "VERIFIED";
      case NegotiationState::kFinalized:
        return "FINALIZED";
      case NegotiationState::kTerminated:
        return "TERMINATED";
    }
    return "UNKNOWN";
  }
}  // namespace ds::negotiation
