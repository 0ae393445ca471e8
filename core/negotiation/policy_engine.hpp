/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "claims/types.hpp"
#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace ds::negotiation {
  using claims::ClaimSet;
  using claims::VerifiedClaims;
  using primitives::AssetId;

  enum class PolicyDecision {
    kAllow,
    kDeny,
  };

  /**
   * Decides whether requester may get an offer for asset
   */
  class PolicyEngine {
   public:
    virtual ~PolicyEngine() = default;

    virtual outcome::result<PolicyDecision> evaluate(
        const VerifiedClaims &claims, const AssetId &asset_id) const = 0;
  };

  /**
   * Allows asset to requesters presenting all required claims, assets
   * without requirements are open to everyone
   */
  class ClaimPolicyEngine : public PolicyEngine {
   public:
    void require(const AssetId &asset_id, const ClaimSet &claims);

    outcome::result<PolicyDecision> evaluate(
        const VerifiedClaims &claims, const AssetId &asset_id) const override;

   private:
    mutable std::mutex mutex_;
    std::map<AssetId, ClaimSet> requirements_;
  };
}  // namespace ds::negotiation
