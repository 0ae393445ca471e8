/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace ds::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /// Sink added to every logger created after it is set
  extern spdlog::sink_ptr file_sink;

  /**
   * Finds or creates logger of a component
   * @param tag - component name printed with every record
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Sets level of existing and future loggers
   * @param level - spdlog level name, e.g. "debug" or "warning"
   * @return false if level name is unknown
   */
  bool setLogLevel(const std::string &level);
}  // namespace ds::common
