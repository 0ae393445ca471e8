/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "claims/impl/claims_authority_impl.hpp"

#include <jwt-cpp/jwt.h>

#include "claims/claims_error.hpp"
#include "common/uuid.hpp"

namespace ds::claims {
  using codec::json::decodeDocument;
  using codec::json::encodeDocument;

  namespace {
    constexpr auto kTokenType{"JWT"};
    /// json encoded claim set
    constexpr auto kClaimsKey{"vc"};

    Bytes tokenKey(const std::string &id) {
      return copy("/claims/token/" + id);
    }

    Bytes credentialKey(const std::string &id) {
      return copy("/claims/credential/" + id);
    }

    Bytes revokedKey(const std::string &id) {
      return copy("/claims/revoked/" + id);
    }
  }  // namespace

  ClaimsAuthorityImpl::ClaimsAuthorityImpl(
      ClaimsConfig config,
      std::shared_ptr<UTCClock> clock,
      std::shared_ptr<PersistentBufferMap> storage,
      std::shared_ptr<AttestationSource> attestation)
      : config_{std::move(config)},
        clock_{std::move(clock)},
        storage_{std::move(storage)},
        attestation_{std::move(attestation)},
        logger_{common::createLogger("claims")} {
    trusted_issuers_.emplace(config_.issuer, config_.public_key);
  }

  const std::string &ClaimsAuthorityImpl::issuer() const {
    return config_.issuer;
  }

  outcome::result<Credential> ClaimsAuthorityImpl::issueCredential(
      const std::string &subject, const ClaimSet &claims) {
    auto attested = attestation_->attest(subject, claims);
    if (!attested) {
      logger_->warn("Credential for {} denied: {}",
                    subject,
                    attested.error().message());
      return attested.error();
    }

    Credential credential;
    credential.id = common::generateUuid();
    credential.issuer = config_.issuer;
    credential.subject = subject;
    credential.claims = std::move(attested.value());
    credential.expiry = clock_->nowUTC() + config_.credential_ttl;
    OUTCOME_TRYA(credential.signature,
                 signJwt(credential.id,
                         subject,
                         credential.claims,
                         credential.expiry));

    OUTCOME_TRY(encoded, encodeDocument(credential));
    {
      std::lock_guard lock{write_mutex_};
      OUTCOME_TRY(storage_->put(credentialKey(credential.id), encoded));
    }
    logger_->debug("Issued credential {} to {}", credential.id, subject);
    return credential;
  }

  outcome::result<VerifiedClaims> ClaimsAuthorityImpl::verifyPresentation(
      const Presentation &presentation) const {
    auto maybe_decoded =
        [&]() -> outcome::result<::jwt::decoded_jwt<::jwt::picojson_traits>> {
      try {
        return ::jwt::decode(presentation.jwt);
      } catch (const std::exception &e) {
        logger_->error("Presentation jwt decode: {}", e.what());
        return ClaimsError::kMalformed;
      }
    }();
    OUTCOME_TRY(decoded, maybe_decoded);

    VerifiedClaims verified;
    try {
      if (!decoded.has_issuer() || !decoded.has_id()
          || !decoded.has_subject() || !decoded.has_expires_at()
          || !decoded.has_payload_claim(kClaimsKey)) {
        return ClaimsError::kMalformed;
      }
      verified.id = decoded.get_id();
      verified.issuer = decoded.get_issuer();
      verified.subject = decoded.get_subject();
      verified.expiry = clock::fromTimePoint(decoded.get_expires_at());
      auto encoded_claims = decoded.get_payload_claim(kClaimsKey).as_string();
      OUTCOME_TRYA(verified.claims,
                   decodeDocument<ClaimSet>(copy(encoded_claims)));
    } catch (const std::exception &e) {
      logger_->error("Presentation jwt claims: {}", e.what());
      return ClaimsError::kMalformed;
    }

    auto public_key = publicKeyOf(verified.issuer);
    if (!public_key) {
      logger_->error("Untrusted issuer {} of {}", verified.issuer, verified.id);
      return ClaimsError::kUntrustedIssuer;
    }

    std::error_code ec;
    try {
      ::jwt::algorithm::es256{*public_key}.verify(
          decoded.get_header_base64() + "." + decoded.get_payload_base64(),
          decoded.get_signature(),
          ec);
    } catch (const std::exception &e) {
      logger_->error("Public key of {}: {}", verified.issuer, e.what());
      return ClaimsError::kInvalidSignature;
    }
    if (ec) {
      logger_->error("Invalid signature of {}: {}", verified.id, ec.message());
      return ClaimsError::kInvalidSignature;
    }

    if (verified.expiry <= clock_->nowUTC()) {
      return ClaimsError::kExpired;
    }

    OUTCOME_TRY(revoked, checkRevocation(verified.id));
    if (revoked) {
      logger_->warn("Presentation {} is revoked", verified.id);
      return ClaimsError::kRevoked;
    }

    if (!presentation.holder.empty()
        && presentation.holder != verified.subject) {
      return ClaimsError::kHolderMismatch;
    }
    return verified;
  }

  outcome::result<bool> ClaimsAuthorityImpl::checkRevocation(
      const std::string &id) const {
    return storage_->contains(revokedKey(id));
  }

  outcome::result<Token> ClaimsAuthorityImpl::issueToken(
      const ProcessId &process_id, TransferType direction) {
    Token token;
    token.id = common::generateUuid();
    token.issuer = config_.issuer;
    token.process_id = process_id;
    token.direction = direction;
    token.expiry = clock_->nowUTC() + config_.token_ttl;
    OUTCOME_TRYA(token.value,
                 signJwt(token.id,
                         process_id,
                         {{kProcessIdClaim, process_id},
                          {kDirectionClaim, primitives::toString(direction)}},
                         token.expiry));

    OUTCOME_TRY(encoded, encodeDocument(token));
    {
      std::lock_guard lock{write_mutex_};
      OUTCOME_TRY(storage_->put(tokenKey(token.id), encoded));
    }
    logger_->debug("Issued token {} for process {}", token.id, process_id);
    return token;
  }

  outcome::result<void> ClaimsAuthorityImpl::revokeToken(
      const std::string &token_id) {
    std::lock_guard lock{write_mutex_};
    const auto key = tokenKey(token_id);
    if (!storage_->contains(key)) {
      logger_->debug("Revocation of unknown token {} ignored", token_id);
      return outcome::success();
    }
    OUTCOME_TRY(encoded, storage_->get(key));
    OUTCOME_TRY(token, decodeDocument<Token>(encoded));
    if (token.revoked) {
      return outcome::success();
    }
    token.revoked = true;
    OUTCOME_TRY(updated, encodeDocument(token));

    auto batch = storage_->batch();
    OUTCOME_TRY(batch->put(key, updated));
    OUTCOME_TRY(batch->put(revokedKey(token_id),
                           copy(std::to_string(clock_->nowUTC().count()))));
    OUTCOME_TRY(batch->commit());
    logger_->debug("Revoked token {} of process {}", token_id, token.process_id);
    return outcome::success();
  }

  outcome::result<void> ClaimsAuthorityImpl::revokeCredential(
      const std::string &credential_id) {
    std::lock_guard lock{write_mutex_};
    const auto key = credentialKey(credential_id);
    if (!storage_->contains(key)) {
      logger_->debug("Revocation of unknown credential {} ignored",
                     credential_id);
      return outcome::success();
    }
    OUTCOME_TRY(encoded, storage_->get(key));
    OUTCOME_TRY(credential, decodeDocument<Credential>(encoded));
    if (credential.status == CredentialStatus::kRevoked) {
      return outcome::success();
    }
    credential.status = CredentialStatus::kRevoked;
    OUTCOME_TRY(updated, encodeDocument(credential));

    auto batch = storage_->batch();
    OUTCOME_TRY(batch->put(key, updated));
    OUTCOME_TRY(batch->put(revokedKey(credential_id),
                           copy(std::to_string(clock_->nowUTC().count()))));
    OUTCOME_TRY(batch->commit());
    logger_->debug("Revoked credential {}", credential_id);
    return outcome::success();
  }

  outcome::result<Token> ClaimsAuthorityImpl::findToken(
      const std::string &token_id) const {
    const auto key = tokenKey(token_id);
    if (!storage_->contains(key)) {
      return ClaimsError::kTokenNotFound;
    }
    OUTCOME_TRY(encoded, storage_->get(key));
    return decodeDocument<Token>(encoded);
  }

  outcome::result<std::string> ClaimsAuthorityImpl::sign(
      const std::string &subject, const ClaimSet &claims) {
    return signJwt(common::generateUuid(),
                   subject,
                   claims,
                   clock_->nowUTC() + config_.credential_ttl);
  }

  void ClaimsAuthorityImpl::addTrustedIssuer(const std::string &issuer,
                                             const std::string &public_key) {
    std::lock_guard lock{issuers_mutex_};
    trusted_issuers_[issuer] = public_key;
  }

  outcome::result<std::string> ClaimsAuthorityImpl::signJwt(
      const std::string &id,
      const std::string &subject,
      const ClaimSet &claims,
      UnixTime expiry) const {
    OUTCOME_TRY(encoded_claims, encodeDocument(claims));
    std::error_code ec;
    std::string jwt;
    try {
      jwt = ::jwt::create()
                .set_type(kTokenType)
                .set_id(id)
                .set_issuer(config_.issuer)
                .set_subject(subject)
                .set_issued_at(clock::toTimePoint(clock_->nowUTC()))
                .set_expires_at(clock::toTimePoint(expiry))
                .set_payload_claim(
                    kClaimsKey,
                    ::jwt::claim(std::string{bytestr(encoded_claims)}))
                .sign(::jwt::algorithm::es256{config_.public_key,
                                              config_.private_key},
                      ec);
    } catch (const std::exception &e) {
      logger_->error("Signing key of {}: {}", config_.issuer, e.what());
      return ClaimsError::kInvalidKey;
    }
    if (ec) {
      logger_->error("Error when sign {}: {}", id, ec.message());
      return ClaimsError::kSigningFailed;
    }
    return jwt;
  }

  boost::optional<std::string> ClaimsAuthorityImpl::publicKeyOf(
      const std::string &issuer) const {
    std::lock_guard lock{issuers_mutex_};
    auto it = trusted_issuers_.find(issuer);
    if (it == trusted_issuers_.end()) {
      return boost::none;
    }
    return it->second;
  }
}  // namespace ds::claims
