/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_DATASPACE_CORE_CONFIG_CONFIG_ERROR_HPP
#define CPP_DATASPACE_CORE_CONFIG_CONFIG_ERROR_HPP

#include "common/outcome.hpp"

namespace ds::config {

  /**
   * @brief Config returns these types of errors
   */
  enum class ConfigError {
    kJSONParserError = 1,
    kBadPath,
    kCannotOpenFile,
    kBadValue,
  };

}  // namespace ds::config

OUTCOME_HPP_DECLARE_ERROR(ds::config, ConfigError);

#endif  // CPP_DATASPACE_CORE_CONFIG_CONFIG_ERROR_HPP
