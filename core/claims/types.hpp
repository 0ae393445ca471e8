/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

#include "clock/time.hpp"
#include "codec/json/coding.hpp"
#include "primitives/types.hpp"

namespace ds::claims {
  using clock::UnixTime;
  using primitives::ProcessId;
  using primitives::TransferType;

  /// Claim name to claim value
  using ClaimSet = std::map<std::string, std::string>;

  /// Claim names of transfer tokens
  constexpr auto kProcessIdClaim{"process_id"};
  constexpr auto kDirectionClaim{"direction"};

  /**
   * Capability bound to one transfer process and one direction
   */
  struct Token {
    /// unique token id, jti of the jwt
    std::string id;
    /// signed jwt
    std::string value;
    std::string issuer;
    ProcessId process_id;
    TransferType direction{TransferType::kPull};
    UnixTime expiry{};
    bool revoked{false};
  };

  enum class CredentialStatus : uint64_t {
    kValid = 0,
    kRevoked,
    kExpired,
  };

  /**
   * Verifiable claim about a participant
   */
  struct Credential {
    std::string id;
    std::string issuer;
    std::string subject;
    ClaimSet claims;
    /// signed jwt carrying all the fields above
    std::string signature;
    UnixTime expiry{};
    CredentialStatus status{CredentialStatus::kValid};
  };

  /**
   * Credential presented by a holder to authenticate a request
   */
  struct Presentation {
    /// expected subject, not checked when empty
    std::string holder;
    std::string jwt;
  };

  /**
   * Result of successful verification
   */
  struct VerifiedClaims {
    std::string id;
    std::string issuer;
    std::string subject;
    ClaimSet claims;
    UnixTime expiry{};
  };

  JSON_ENCODE(Token) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "id", v.id, allocator);
    codec::json::Set(j, "value", v.value, allocator);
    codec::json::Set(j, "issuer", v.issuer, allocator);
    codec::json::Set(j, "process_id", v.process_id, allocator);
    codec::json::SetEnum(j, "direction", v.direction, allocator);
    codec::json::SetDuration(j, "expiry", v.expiry, allocator);
    codec::json::Set(j, "revoked", v.revoked, allocator);
    return j;
  }

  JSON_DECODE(Token) {
    codec::json::Get(j, "id", v.id);
    codec::json::Get(j, "value", v.value);
    codec::json::Get(j, "issuer", v.issuer);
    codec::json::Get(j, "process_id", v.process_id);
    codec::json::GetEnum(j, "direction", v.direction, TransferType::kPull);
    codec::json::GetDuration(j, "expiry", v.expiry);
    codec::json::Get(j, "revoked", v.revoked);
  }

  JSON_ENCODE(Credential) {
    codec::json::Value j{rapidjson::kObjectType};
    codec::json::Set(j, "id", v.id, allocator);
    codec::json::Set(j, "issuer", v.issuer, allocator);
    codec::json::Set(j, "subject", v.subject, allocator);
    codec::json::Set(j, "claims", v.claims, allocator);
    codec::json::Set(j, "signature", v.signature, allocator);
    codec::json::SetDuration(j, "expiry", v.expiry, allocator);
    codec::json::SetEnum(j, "status", v.status, allocator);
    return j;
  }

  JSON_DECODE(Credential) {
    codec::json::Get(j, "id", v.id);
    codec::json::Get(j, "issuer", v.issuer);
    codec::json::Get(j, "subject", v.subject);
    codec::json::Get(j, "claims", v.claims);
    codec::json::Get(j, "signature", v.signature);
    codec::json::GetDuration(j, "expiry", v.expiry);
    codec::json::GetEnum(
        j, "status", v.status, CredentialStatus::kExpired);
  }
}  // namespace ds::claims
