/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "claims/types.hpp"
#include "primitives/contract.hpp"
#include "primitives/types.hpp"

namespace ds::protocol {
  using claims::ClaimSet;
  using primitives::ContractAgreement;
  using primitives::ContractOffer;
  using primitives::DataAddress;
  using primitives::ParticipantId;
  using primitives::ProcessId;
  using primitives::TerminationReason;
  using primitives::TransferType;

  enum class MessageType : uint64_t {
    kContractRequest = 1,
    kContractOffer,
    kContractAgreement,
    kContractAgreementVerification,
    kContractNegotiationEvent,
    kContractNegotiationTermination,
    kTransferRequest,
    kTransferStart,
    kTransferSuspension,
    kTransferCompletion,
    kTransferTermination,
    kCredentialRequest,
    kCredentialOffer,
    kPresentationQuery,
    kRevocationCheck,
  };

  /// Event type of kContractNegotiationEvent
  enum class NegotiationEventType : uint64_t {
    kAccepted = 1,
    kDeclined,
    kFinalized,
  };

  std::string toString(MessageType type);

  /**
   * Protocol message exchanged between participants. Header fields are set
   * on every message, payload fields depend on message type.
   */
  struct Message {
    MessageType type{MessageType::kContractRequest};
    /// unique id, kept on redelivery
    std::string message_id;
    ParticipantId sender;
    ProcessId consumer_pid;
    ProcessId provider_pid;
    /// jwt presentation of the sender
    std::string presentation;

    /// request or reply correlation
    boost::optional<std::string> in_reply_to;

    boost::optional<ContractOffer> offer;
    boost::optional<ContractAgreement> agreement;
    boost::optional<NegotiationEventType> event;

    boost::optional<std::string> agreement_id;
    boost::optional<TransferType> transfer_type;
    /// push destination or pull endpoint
    boost::optional<DataAddress> data_address;
    /// pull endpoint authorization
    boost::optional<std::string> token;

    boost::optional<TerminationReason> reason;
    boost::optional<std::string> detail;

    boost::optional<ClaimSet> claims;
    /// credential jwt
    boost::optional<std::string> credential;
    boost::optional<std::string> credential_id;
    boost::optional<bool> revoked;
  };

  codec::json::Value encode(const Message &v,
                            rapidjson::MemoryPoolAllocator<> &allocator);

  void decode(Message &v, const codec::json::Value &j);
}  // namespace ds::protocol
