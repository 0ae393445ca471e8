/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/types.hpp"

namespace ds::transfer {
  std::string toString(TransferState state) {
    switch (state) {
      case TransferState::kRequested:
        return "REQUESTED";
      case TransferState::kProvisioned:
        return "PROVISIONED";
      case TransferState::kStarted:
        return "STARTED";
      case TransferState::kSuspended:
        return "SUSPENDED";
      case TransferState::kCompleted:
        return "COMPLETED";
      case TransferState::kTerminated:
        return "TERMINATED";
    }
    return "UNKNOWN";
  }
}  // namespace ds::transfer
