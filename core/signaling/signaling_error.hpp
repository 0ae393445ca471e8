/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::signaling {

  enum class SignalingError {
    kInvalidStateTransition = 1,
    kParametersMismatch,
  };

}  // namespace ds::signaling

OUTCOME_HPP_DECLARE_ERROR(ds::signaling, SignalingError);
