/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include "codec/json/coding.hpp"

namespace ds::primitives {
  using ProcessId = std::string;
  using ParticipantId = std::string;
  using AssetId = std::string;

  /** Transfer directionality */
  enum class TransferType : uint64_t {
    /// provider initiated send to the consumer destination
    kPush = 1,
    /// consumer fetches data from the provider endpoint with a token
    kPull = 2,
  };

  /**
   * Reason a negotiation or transfer process was ended, kept on the record
   */
  enum class TerminationReason : uint64_t {
    kNone = 0,
    kCompleted,
    kPolicyDenied,
    kOfferLimitExceeded,
    kVerificationFailed,
    kCounterpartyUnreachable,
    kCounterpartyAbort,
    kTimeout,
    kPolicyViolation,
    kManual,
    kSystemError,
  };

  std::string toString(TransferType type);

  std::string toString(TerminationReason reason);

  /**
   * Location of data, either a push destination or a pull source
   */
  struct DataAddress {
    /// endpoint kind, e.g. "HttpData"
    std::string type;
    std::string endpoint;
    std::map<std::string, std::string> properties;
  };

  inline bool operator==(const DataAddress &lhs, const DataAddress &rhs) {
    return lhs.type == rhs.type && lhs.endpoint == rhs.endpoint
           && lhs.properties == rhs.properties;
  }

  inline bool operator!=(const DataAddress &lhs, const DataAddress &rhs) {
    return !(lhs == rhs);
  }

  JSON_ENCODE(DataAddress) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "type", v.type, allocator);
    codec::json::Set(j, "endpoint", v.endpoint, allocator);
    codec::json::Set(j, "properties", v.properties, allocator);
    return j;
  }

  JSON_DECODE(DataAddress) {
    codec::json::Get(j, "type", v.type);
    codec::json::Get(j, "endpoint", v.endpoint);
    codec::json::GetOptional(j, "properties", v.properties);
  }
}  // namespace ds::primitives
