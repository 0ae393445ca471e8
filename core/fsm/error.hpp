/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_DATASPACE_CORE_FSM_ERROR_HPP
#define CPP_DATASPACE_CORE_FSM_ERROR_HPP

#include "common/outcome.hpp"

namespace ds::fsm {

  enum class FsmError {
    kInvalidTransition = 1,
  };

}

OUTCOME_HPP_DECLARE_ERROR(ds::fsm, FsmError);

#endif  // CPP_DATASPACE_CORE_FSM_ERROR_HPP
