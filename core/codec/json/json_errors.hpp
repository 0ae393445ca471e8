/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::codec::json {
  enum class JsonError {
    kParseError = 1,
    kWrongEnum,
    kWrongType,
    kOutOfRange,
    kFormatError,
  };
}  // namespace ds::codec::json

OUTCOME_HPP_DECLARE_ERROR(ds::codec::json, JsonError);
