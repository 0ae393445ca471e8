/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace ds::clock {
  /**
   * Source of expiry and idle time checks
   */
  class UTCClock {
   public:
    virtual ~UTCClock() = default;

    virtual UnixTime nowUTC() const = 0;
  };
}  // namespace ds::clock
