/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include "claims/types.hpp"
#include "common/outcome.hpp"

namespace ds::claims {

  /**
   * Decides which claims may be issued to a subject. Evaluated once per
   * issuance.
   */
  class AttestationSource {
   public:
    virtual ~AttestationSource() = default;

    /**
     * @param subject - credential subject
     * @param requested - claims requested for the credential
     * @return attested claims or kIssuanceDenied
     */
    virtual outcome::result<ClaimSet> attest(
        const std::string &subject, const ClaimSet &requested) const = 0;
  };

  /**
   * Attestation by a fixed table of subject entitlements
   */
  class StaticAttestationSource : public AttestationSource {
   public:
    /// Grants claims to subject, existing values are overwritten
    void entitle(const std::string &subject, const ClaimSet &claims);

    outcome::result<ClaimSet> attest(
        const std::string &subject, const ClaimSet &requested) const override;

   private:
    mutable std::mutex mutex_;
    std::map<std::string, ClaimSet> entitlements_;
  };
}  // namespace ds::claims
