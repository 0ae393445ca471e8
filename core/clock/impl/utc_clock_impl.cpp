/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/utc_clock_impl.hpp"

namespace ds::clock {
  UnixTime UTCClockImpl::nowUTC() const {
    return fromTimePoint(std::chrono::system_clock::now());
  }
}  // namespace ds::clock
