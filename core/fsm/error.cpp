/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fsm/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::fsm, FsmError, e) {
  using E = ds::fsm::FsmError;
  switch (e) {
    case E::kInvalidTransition:
      return "No transition is defined for the event in the current state.";
  }
  return "Unknown FSM error.";
}
