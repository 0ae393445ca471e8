/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ds::transfer {

  enum class TransferError {
    kInvalidStateTransition = 1,
    kContractNotAgreed,
    kWrongRole,
    kMalformedMessage,
  };

}  // namespace ds::transfer

OUTCOME_HPP_DECLARE_ERROR(ds::transfer, TransferError);
