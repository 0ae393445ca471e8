/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signaling/signaling_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::signaling, SignalingError, e) {
  using E = ds::signaling::SignalingError;
  switch (e) {
    case E::kInvalidStateTransition:
      return "SignalingError: invalid data flow state transition";
    case E::kParametersMismatch:
      return "SignalingError: start parameters differ from the existing flow";
  }
  return "SignalingError: unknown error";
}
