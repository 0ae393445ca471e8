/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "claims/types.hpp"
#include "common/outcome.hpp"

namespace ds::claims {

  /**
   * Issues, verifies and revokes tokens and credentials of one participant.
   * Every issuance and revocation is durable when the call returns.
   */
  class ClaimsAuthority {
   public:
    virtual ~ClaimsAuthority() = default;

    /// Issuer id put into everything signed by the authority
    virtual const std::string &issuer() const = 0;

    /**
     * Issues credential after attestation of requested claims
     * @param subject - participant the credential is about
     * @param claims - requested claims
     * @return credential or kIssuanceDenied
     */
    virtual outcome::result<Credential> issueCredential(
        const std::string &subject, const ClaimSet &claims) = 0;

    /**
     * Verifies presented jwt: issuer is trusted, signature is valid, claims
     * are not expired and the credential or token is not revoked
     * @return verified claims or one of verification errors
     */
    virtual outcome::result<VerifiedClaims> verifyPresentation(
        const Presentation &presentation) const = 0;

    /**
     * @param id - credential or token id
     * @return true if revoked by this authority
     */
    virtual outcome::result<bool> checkRevocation(
        const std::string &id) const = 0;

    /**
     * Mints new token with a fresh expiry
     * @param process_id - transfer process the token is bound to
     * @param direction - transfer direction
     */
    virtual outcome::result<Token> issueToken(const ProcessId &process_id,
                                              TransferType direction) = 0;

    /// Revokes token, unknown and already revoked tokens are ignored
    virtual outcome::result<void> revokeToken(const std::string &token_id) = 0;

    /// Revokes credential, unknown and already revoked ones are ignored
    virtual outcome::result<void> revokeCredential(
        const std::string &credential_id) = 0;

    /**
     * Reads token record
     * @return token or kTokenNotFound
     */
    virtual outcome::result<Token> findToken(
        const std::string &token_id) const = 0;

    /**
     * Signs claims about subject on behalf of the authority issuer, used for
     * contract agreement signatures
     * @return signed jwt
     */
    virtual outcome::result<std::string> sign(const std::string &subject,
                                              const ClaimSet &claims) = 0;

    /// Trusts jwt of another issuer verified with its PEM public key
    virtual void addTrustedIssuer(const std::string &issuer,
                                  const std::string &public_key) = 0;
  };
}  // namespace ds::claims
