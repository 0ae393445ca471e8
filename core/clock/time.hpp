/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace ds::clock {
  /// Seconds since epoch, resolution of token and credential expiry
  using UnixTime = std::chrono::seconds;

  inline std::chrono::system_clock::time_point toTimePoint(UnixTime time) {
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(time)};
  }

  inline UnixTime fromTimePoint(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<UnixTime>(time.time_since_epoch());
  }
}  // namespace ds::clock
