/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/message.hpp"

namespace ds::protocol {
  namespace json = codec::json;

  namespace {
    template <typename T>
    void setOptional(json::Value &j,
                     std::string_view key,
                     const boost::optional<T> &v,
                     rapidjson::MemoryPoolAllocator<> &allocator) {
      if (v) {
        json::Set(j, key, *v, allocator);
      }
    }

    template <typename T>
    void setOptionalEnum(json::Value &j,
                         std::string_view key,
                         const boost::optional<T> &v,
                         rapidjson::MemoryPoolAllocator<> &allocator) {
      if (v) {
        json::SetEnum(j, key, *v, allocator);
      }
    }

    template <typename T>
    void getOptionalEnum(const json::Value &j,
                         const char *key,
                         boost::optional<T> &v,
                         T max) {
      if (j.HasMember(key)) {
        T value{};
        json::GetEnum(j, key, value, max);
        v = value;
      }
    }
  }  // namespace

  std::string toString(MessageType type) {
    switch (type) {
      case MessageType::kContractRequest:
        return "ContractRequest";
      case MessageType::kContractOffer:
        return "ContractOffer";
      case MessageType::kContractAgreement:
        return "ContractAgreement";
      case MessageType::kContractAgreementVerification:
        return "ContractAgreementVerification";
      case MessageType::kContractNegotiationEvent:
        return "ContractNegotiationEvent";
      case MessageType::kContractNegotiationTermination:
        return "ContractNegotiationTermination";
      case MessageType::kTransferRequest:
        return "TransferRequest";
      case MessageType::kTransferStart:
        return "TransferStart";
      case MessageType::kTransferSuspension:
        return "TransferSuspension";
      case MessageType::kTransferCompletion:
        return "TransferCompletion";
      case MessageType::kTransferTermination:
        return "TransferTermination";
      case MessageType::kCredentialRequest:
        return "CredentialRequest";
      case MessageType::kCredentialOffer:
        return "CredentialOffer";
      case MessageType::kPresentationQuery:
        return "PresentationQuery";
      case MessageType::kRevocationCheck:
        return "RevocationCheck";
    }
    return "Unknown";
  }

  json::Value encode(const Message &v,
                     rapidjson::MemoryPoolAllocator<> &allocator) {
    json::Value j{rapidjson::kObjectType};
    json::SetEnum(j, "type", v.type, allocator);
    json::Set(j, "message_id", v.message_id, allocator);
    json::Set(j, "sender", v.sender, allocator);
    json::Set(j, "consumer_pid", v.consumer_pid, allocator);
    json::Set(j, "provider_pid", v.provider_pid, allocator);
    json::Set(j, "presentation", v.presentation, allocator);
    setOptional(j, "in_reply_to", v.in_reply_to, allocator);
    setOptional(j, "offer", v.offer, allocator);
    setOptional(j, "agreement", v.agreement, allocator);
    setOptionalEnum(j, "event", v.event, allocator);
    setOptional(j, "agreement_id", v.agreement_id, allocator);
    setOptionalEnum(j, "transfer_type", v.transfer_type, allocator);
    setOptional(j, "data_address", v.data_address, allocator);
    setOptional(j, "token", v.token, allocator);
    setOptionalEnum(j, "reason", v.reason, allocator);
    setOptional(j, "detail", v.detail, allocator);
    setOptional(j, "claims", v.claims, allocator);
    setOptional(j, "credential", v.credential, allocator);
    setOptional(j, "credential_id", v.credential_id, allocator);
    setOptional(j, "revoked", v.revoked, allocator);
    return j;
  }

  void decode(Message &v, const json::Value &j) {
    json::GetEnum(j, "type", v.type, MessageType::kRevocationCheck);
    if (v.type < MessageType::kContractRequest) {
      outcome::raise(codec::json::JsonError::kWrongEnum);
    }
    json::Get(j, "message_id", v.message_id);
    json::Get(j, "sender", v.sender);
    json::Get(j, "consumer_pid", v.consumer_pid);
    json::Get(j, "provider_pid", v.provider_pid);
    json::Get(j, "presentation", v.presentation);
    json::GetOptional(j, "in_reply_to", v.in_reply_to);
    json::GetOptional(j, "offer", v.offer);
    json::GetOptional(j, "agreement", v.agreement);
    getOptionalEnum(j, "event", v.event, NegotiationEventType::kFinalized);
    json::GetOptional(j, "agreement_id", v.agreement_id);
    getOptionalEnum(j, "transfer_type", v.transfer_type, TransferType::kPull);
    json::GetOptional(j, "data_address", v.data_address);
    json::GetOptional(j, "token", v.token);
    getOptionalEnum(
        j, "reason", v.reason, TerminationReason::kSystemError);
    json::GetOptional(j, "detail", v.detail);
    json::GetOptional(j, "claims", v.claims);
    json::GetOptional(j, "credential", v.credential);
    json::GetOptional(j, "credential_id", v.credential_id);
    json::GetOptional(j, "revoked", v.revoked);
  }
}  // namespace ds::protocol
