/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::protocol {

  enum class ProtocolError {
    kDeliveryFailed = 1,
    kCounterpartyUnreachable,
    kMalformedMessage,
  };

}  // namespace ds::protocol

OUTCOME_HPP_DECLARE_ERROR(ds::protocol, ProtocolError);
