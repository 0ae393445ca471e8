/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>

#include <boost/optional.hpp>

#include "clock/time.hpp"
#include "primitives/types.hpp"

namespace ds::transfer {
  using clock::UnixTime;
  using primitives::DataAddress;
  using primitives::ParticipantId;
  using primitives::ProcessId;
  using primitives::TerminationReason;
  using primitives::TransferType;

  enum class TransferState : uint64_t {
    kRequested = 1,
    kProvisioned,
    kStarted,
    kSuspended,
    /// terminal success
    kCompleted,
    kTerminated,
  };

  /// Provider runs the data plane, consumer receives the data
  enum class TransferRole : uint64_t {
    kConsumer = 1,
    kProvider,
  };

  enum class TransferEvent {
    kProvision = 1,
    /// start provisioned transfer or resume suspended one
    kStart,
    kSuspend,
    kComplete,
    kTerminate,
  };

  std::string toString(TransferState state);

  /// Completed or terminated
  inline bool isTerminal(TransferState state) {
    return state == TransferState::kCompleted
           || state == TransferState::kTerminated;
  }

  /**
   * One side view of a data transfer under a finalized agreement
   */
  struct TransferProcess {
    ProcessId id;
    TransferRole role{TransferRole::kConsumer};
    std::string agreement_id;
    TransferType type{TransferType::kPull};
    ParticipantId counterparty_id;
    ProcessId counterparty_pid;
    /// push destination or pull source
    DataAddress address;
    TransferState state{TransferState::kRequested};
    /// pull endpoint, set while started
    DataAddress endpoint;
    /// token jwt of a pull transfer, kept by consumer only
    std::string token;
    /// id of the live token, kept by provider only
    std::string token_id;
    /// ids of applied inbound messages
    std::set<std::string> processed_messages;
    TerminationReason termination_reason{TerminationReason::kNone};
    /// last failure
    std::string message;
  };

  JSON_ENCODE(TransferProcess) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "id", v.id, allocator);
    codec::json::SetEnum(j, "role", v.role, allocator);
    codec::json::Set(j, "agreement_id", v.agreement_id, allocator);
    codec::json::SetEnum(j, "type", v.type, allocator);
    codec::json::Set(j, "counterparty_id", v.counterparty_id, allocator);
    codec::json::Set(j, "counterparty_pid", v.counterparty_pid, allocator);
    codec::json::Set(j, "address", v.address, allocator);
    codec::json::SetEnum(j, "state", v.state, allocator);
    codec::json::Set(j, "endpoint", v.endpoint, allocator);
    codec::json::Set(j, "token", v.token, allocator);
    codec::json::Set(j, "token_id", v.token_id, allocator);
    codec::json::Set(j, "processed_messages", v.processed_messages, allocator);
    codec::json::SetEnum(
        j, "termination_reason", v.termination_reason, allocator);
    codec::json::Set(j, "message", v.message, allocator);
    return j;
  }

  JSON_DECODE(TransferProcess) {
    codec::json::Get(j, "id", v.id);
    codec::json::GetEnum(j, "role", v.role, TransferRole::kProvider);
    codec::json::Get(j, "agreement_id", v.agreement_id);
    codec::json::GetEnum(j, "type", v.type, TransferType::kPull);
    codec::json::Get(j, "counterparty_id", v.counterparty_id);
    codec::json::Get(j, "counterparty_pid", v.counterparty_pid);
    codec::json::Get(j, "address", v.address);
    codec::json::GetEnum(j, "state", v.state, TransferState::kTerminated);
    codec::json::Get(j, "endpoint", v.endpoint);
    codec::json::Get(j, "token", v.token);
    codec::json::Get(j, "token_id", v.token_id);
    codec::json::Get(j, "processed_messages", v.processed_messages);
    codec::json::GetEnum(j,
                         "termination_reason",
                         v.termination_reason,
                         TerminationReason::kSystemError);
    codec::json::Get(j, "message", v.message);
  }
}  // namespace ds::transfer
