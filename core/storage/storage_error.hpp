/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::storage {

  enum class StorageError {
    kNotFound = 1,
  };

}  // namespace ds::storage

OUTCOME_HPP_DECLARE_ERROR(ds::storage, StorageError);
