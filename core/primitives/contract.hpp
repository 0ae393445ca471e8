/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/types.hpp"

namespace ds::primitives {

  /**
   * Usage terms for an asset proposed by one of the parties
   */
  struct ContractOffer {
    std::string offer_id;
    AssetId asset_id;
    /// serialized usage policy
    std::string policy;
    ParticipantId offered_by;
  };

  inline bool operator==(const ContractOffer &lhs, const ContractOffer &rhs) {
    return lhs.offer_id == rhs.offer_id && lhs.asset_id == rhs.asset_id
           && lhs.policy == rhs.policy && lhs.offered_by == rhs.offered_by;
  }

  /**
   * Contract signed by both parties, signatures are jwt over agreement terms
   */
  struct ContractAgreement {
    std::string agreement_id;
    ContractOffer offer;
    ParticipantId consumer_id;
    ParticipantId provider_id;
    std::string consumer_signature;
    std::string provider_signature;

    bool isSigned() const {
      return !consumer_signature.empty() && !provider_signature.empty();
    }
  };

  /**
   * Terms covered by signatures of the agreement
   */
  inline std::map<std::string, std::string> agreementTerms(
      const ContractAgreement &agreement) {
    return {
        {"agreement_id", agreement.agreement_id},
        {"offer_id", agreement.offer.offer_id},
        {"asset_id", agreement.offer.asset_id},
        {"policy", agreement.offer.policy},
        {"consumer", agreement.consumer_id},
        {"provider", agreement.provider_id},
    };
  }

  JSON_ENCODE(ContractOffer) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "offer_id", v.offer_id, allocator);
    codec::json::Set(j, "asset_id", v.asset_id, allocator);
    codec::json::Set(j, "policy", v.policy, allocator);
    codec::json::Set(j, "offered_by", v.offered_by, allocator);
    return j;
  }

  JSON_DECODE(ContractOffer) {
    codec::json::Get(j, "offer_id", v.offer_id);
    codec::json::Get(j, "asset_id", v.asset_id);
    codec::json::Get(j, "policy", v.policy);
    codec::json::Get(j, "offered_by", v.offered_by);
  }

  JSON_ENCODE(ContractAgreement) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "agreement_id", v.agreement_id, allocator);
    codec::json::Set(j, "offer", v.offer, allocator);
    codec::json::Set(j, "consumer_id", v.consumer_id, allocator);
    codec::json::Set(j, "provider_id", v.provider_id, allocator);
    codec::json::Set(j, "consumer_signature", v.consumer_signature, allocator);
    codec::json::Set(j, "provider_signature", v.provider_signature, allocator);
    return j;
  }

  JSON_DECODE(ContractAgreement) {
    codec::json::Get(j, "agreement_id", v.agreement_id);
    codec::json::Get(j, "offer", v.offer);
    codec::json::Get(j, "consumer_id", v.consumer_id);
    codec::json::Get(j, "provider_id", v.provider_id);
    codec::json::Get(j, "consumer_signature", v.consumer_signature);
    codec::json::Get(j, "provider_signature", v.provider_signature);
  }
}  // namespace ds::primitives
