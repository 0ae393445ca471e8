/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/config_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::config, ConfigError, e) {
  using ds::config::ConfigError;

  switch (e) {
    case (ConfigError::kJSONParserError):
      return "ConfigError: JSON parser error";
    case (ConfigError::kBadPath):
      return "ConfigError: config key is wrong";
    case (ConfigError::kCannotOpenFile):
      return "ConfigError: cannot open file";
    case (ConfigError::kBadValue):
      return "ConfigError: config value has wrong type";
    default:
      return "ConfigError: unknown error";
  }
}
