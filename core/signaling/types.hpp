/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"
#include "primitives/types.hpp"

namespace ds::signaling {
  using clock::UnixTime;
  using primitives::DataAddress;
  using primitives::ProcessId;
  using primitives::TerminationReason;
  using primitives::TransferType;

  /**
   * Local state of a data flow
   */
  enum class DataFlowState : uint64_t {
    kRequested = 1,
    kStarted,
    kSuspended,
    /// terminal
    kTerminated,
  };

  enum class DataFlowEvent {
    /// start new flow or resume suspended one
    kStart = 1,
    kSuspend,
    kTerminate,
  };

  std::string toString(DataFlowState state);

  /**
   * Data flow driven by the control plane, persisted under "/dataflow/<id>"
   */
  struct DataFlow {
    ProcessId id;
    TransferType type{TransferType::kPull};
    /// destination for push, source for pull
    DataAddress address;
    /// endpoint returned by the data plane
    DataAddress endpoint;
    DataFlowState state{DataFlowState::kRequested};
    /// id of the current token, empty when none is live
    std::string token_id;
    TerminationReason termination_reason{TerminationReason::kNone};
    /// last failure
    std::string message;
  };

  /**
   * Endpoint data reference handed out for pull transfers
   */
  struct Edr {
    ProcessId process_id;
    DataAddress endpoint;
    /// token jwt
    std::string token;
    std::string token_id;
    UnixTime expiry{};
  };

  JSON_ENCODE(DataFlow) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "id", v.id, allocator);
    codec::json::SetEnum(j, "type", v.type, allocator);
    codec::json::Set(j, "address", v.address, allocator);
    codec::json::Set(j, "endpoint", v.endpoint, allocator);
    codec::json::SetEnum(j, "state", v.state, allocator);
    codec::json::Set(j, "token_id", v.token_id, allocator);
    codec::json::SetEnum(
        j, "termination_reason", v.termination_reason, allocator);
    codec::json::Set(j, "message", v.message, allocator);
    return j;
  }

  JSON_DECODE(DataFlow) {
    codec::json::Get(j, "id", v.id);
    codec::json::GetEnum(j, "type", v.type, TransferType::kPull);
    codec::json::Get(j, "address", v.address);
    codec::json::Get(j, "endpoint", v.endpoint);
    codec::json::GetEnum(j, "state", v.state, DataFlowState::kTerminated);
    codec::json::Get(j, "token_id", v.token_id);
    codec::json::GetEnum(j,
                         "termination_reason",
                         v.termination_reason,
                         TerminationReason::kSystemError);
    codec::json::Get(j, "message", v.message);
  }
}  // namespace ds::signaling
