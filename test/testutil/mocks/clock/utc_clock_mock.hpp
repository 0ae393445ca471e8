/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "clock/utc_clock.hpp"

namespace ds::clock {
  class UTCClockMock : public UTCClock {
   public:
    MOCK_CONST_METHOD0(nowUTC, UnixTime());
  };
}  // namespace ds::clock
