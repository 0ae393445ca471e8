/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>
#include <vector>

#include <boost/optional.hpp>

#include "clock/time.hpp"
#include "primitives/contract.hpp"

namespace ds::negotiation {
  using clock::UnixTime;
  using primitives::AssetId;
  using primitives::ContractAgreement;
  using primitives::ContractOffer;
  using primitives::ParticipantId;
  using primitives::ProcessId;
  using primitives::TerminationReason;

  enum class NegotiationState : uint64_t {
    kRequested = 1,
    kOffered,
    kAccepted,
    kDeclined,
    kAgreed,
    kVerified,
    /// terminal success
    kFinalized,
    kTerminated,
  };

  enum class NegotiationRole : uint64_t {
    kConsumer = 1,
    kProvider,
  };

  enum class NegotiationEvent {
    /// offer or counter offer
    kOffer = 1,
    kAccept,
    kDecline,
    kAgree,
    kVerify,
    kFinalize,
    kTerminate,
  };

  std::string toString(NegotiationState state);

  /// Finalized or terminated
  inline bool isTerminal(NegotiationState state) {
    return state == NegotiationState::kFinalized
           || state == NegotiationState::kTerminated;
  }

  /**
   * One side view of a contract negotiation
   */
  struct NegotiationProcess {
    ProcessId id;
    NegotiationRole role{NegotiationRole::kConsumer};
    ParticipantId counterparty_id;
    /// process id of the same negotiation at counterparty
    ProcessId counterparty_pid;
    AssetId asset_id;
    NegotiationState state{NegotiationState::kRequested};
    /// offers and counter offers in order of appearance
    std::vector<ContractOffer> offers;
    /// present from acceptance on, signed by both parties from agreement on
    boost::optional<ContractAgreement> agreement;
    /// ids of applied inbound messages
    std::set<std::string> processed_messages;
    TerminationReason termination_reason{TerminationReason::kNone};
    /// last failure
    std::string message;
    UnixTime updated_at{};
  };

  JSON_ENCODE(NegotiationProcess) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "id", v.id, allocator);
    codec::json::SetEnum(j, "role", v.role, allocator);
    codec::json::Set(j, "counterparty_id", v.counterparty_id, allocator);
    codec::json::Set(j, "counterparty_pid", v.counterparty_pid, allocator);
    codec::json::Set(j, "asset_id", v.asset_id, allocator);
    codec::json::SetEnum(j, "state", v.state, allocator);
    codec::json::Set(j, "offers", v.offers, allocator);
    codec::json::Set(j, "agreement", v.agreement, allocator);
    codec::json::Set(j, "processed_messages", v.processed_messages, allocator);
    codec::json::SetEnum(
        j, "termination_reason", v.termination_reason, allocator);
    codec::json::Set(j, "message", v.message, allocator);
    codec::json::SetDuration(j, "updated_at", v.updated_at, allocator);
    return j;
  }

  JSON_DECODE(NegotiationProcess) {
    codec::json::Get(j, "id", v.id);
    codec::json::GetEnum(j, "role", v.role, NegotiationRole::kProvider);
    codec::json::Get(j, "counterparty_id", v.counterparty_id);
    codec::json::Get(j, "counterparty_pid", v.counterparty_pid);
    codec::json::Get(j, "asset_id", v.asset_id);
    codec::json::GetEnum(j, "state", v.state, NegotiationState::kTerminated);
    codec::json::Get(j, "offers", v.offers);
    codec::json::Get(j, "agreement", v.agreement);
    codec::json::Get(j, "processed_messages", v.processed_messages);
    codec::json::GetEnum(j,
                         "termination_reason",
                         v.termination_reason,
                         TerminationReason::kSystemError);
    codec::json::Get(j, "message", v.message);
    codec::json::GetDuration(j, "updated_at", v.updated_at);
  }
}  // namespace ds::negotiation
