/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signaling/types.hpp"

namespace ds::signaling {
  std::string toString(DataFlowState state) {
    switch (state) {
      case DataFlowState::kRequested:
        return "REQUESTED";
      case DataFlowState::kStarted:
        return "STARTED";
      case DataFlowState::kSuspended:
        return "SUSPENDED";
      case DataFlowState::kTerminated:
        return "TERMINATED";
    }
    return "UNKNOWN";
  }
}  // namespace ds::signaling
