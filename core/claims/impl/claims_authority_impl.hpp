/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "claims/attestation_source.hpp"
#include "claims/claims_authority.hpp"
#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "config/engine_config.hpp"
#include "storage/buffer_map.hpp"

namespace ds::claims {
  using clock::UTCClock;
  using config::ClaimsConfig;
  using storage::PersistentBufferMap;

  /**
   * Claims authority signing ES256 jwt with its own P-256 key, jwt of other
   * issuers are verified with their trusted public keys. Records are kept
   * in persistent map:
   * "/claims/token/<id>" - token records
   * "/claims/credential/<id>" - credential records
   * "/claims/revoked/<id>" - revocation marks of tokens and credentials
   */
  class ClaimsAuthorityImpl : public ClaimsAuthority {
   public:
    ClaimsAuthorityImpl(ClaimsConfig config,
                        std::shared_ptr<UTCClock> clock,
                        std::shared_ptr<PersistentBufferMap> storage,
                        std::shared_ptr<AttestationSource> attestation);

    const std::string &issuer() const override;

    outcome::result<Credential> issueCredential(
        const std::string &subject, const ClaimSet &claims) override;

    outcome::result<VerifiedClaims> verifyPresentation(
        const Presentation &presentation) const override;

    outcome::result<bool> checkRevocation(
        const std::string &id) const override;

    outcome::result<Token> issueToken(const ProcessId &process_id,
                                      TransferType direction) override;

    outcome::result<void> revokeToken(const std::string &token_id) override;

    outcome::result<void> revokeCredential(
        const std::string &credential_id) override;

    outcome::result<Token> findToken(
        const std::string &token_id) const override;

    outcome::result<std::string> sign(const std::string &subject,
                                      const ClaimSet &claims) override;

    void addTrustedIssuer(const std::string &issuer,
                          const std::string &public_key) override;

   private:
    outcome::result<std::string> signJwt(const std::string &id,
                                         const std::string &subject,
                                         const ClaimSet &claims,
                                         UnixTime expiry) const;

    boost::optional<std::string> publicKeyOf(const std::string &issuer) const;

    ClaimsConfig config_;
    std::shared_ptr<UTCClock> clock_;
    std::shared_ptr<PersistentBufferMap> storage_;
    std::shared_ptr<AttestationSource> attestation_;

    /// serializes writes of records
    std::mutex write_mutex_;
    mutable std::mutex issuers_mutex_;
    std::map<std::string, std::string> trusted_issuers_;

    common::Logger logger_;
  };
}  // namespace ds::claims
