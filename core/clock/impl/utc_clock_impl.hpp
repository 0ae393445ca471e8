/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/utc_clock.hpp"

namespace ds::clock {
  /// System wall clock
  class UTCClockImpl : public UTCClock {
   public:
    UnixTime nowUTC() const override;
  };
}  // namespace ds::clock
