/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/protocol_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::protocol, ProtocolError, e) {
  using E = ds::protocol::ProtocolError;
  switch (e) {
    case E::kDeliveryFailed:
      return "ProtocolError: message delivery failed";
    case E::kCounterpartyUnreachable:
      return "ProtocolError: counterparty unreachable, retries exhausted";
    case E::kMalformedMessage:
      return "ProtocolError: message lacks required fields";
  }
  return "ProtocolError: unknown error";
}
