/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::transfer, TransferError, e) {
  using E = ds::transfer::TransferError;
  switch (e) {
    case E::kInvalidStateTransition:
      return "TransferError: invalid transfer state transition";
    case E::kContractNotAgreed:
      return "TransferError: no finalized negotiation for the agreement";
    case E::kWrongRole:
      return "TransferError: operation is not allowed for the role";
    case E::kMalformedMessage:
      return "TransferError: message lacks required payload";
  }
  return "TransferError: unknown error";
}
