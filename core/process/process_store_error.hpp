/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::process {

  enum class ProcessStoreError {
    kNotFound = 1,
    kConcurrentModification,
  };

}  // namespace ds::process

OUTCOME_HPP_DECLARE_ERROR(ds::process, ProcessStoreError);
