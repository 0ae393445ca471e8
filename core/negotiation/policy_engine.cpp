/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "negotiation/policy_engine.hpp"

namespace ds::negotiation {

  void ClaimPolicyEngine::require(const AssetId &asset_id,
                                  const ClaimSet &claims) {
    std::lock_guard lock{mutex_};
    requirements_[asset_id] = claims;
  }

  outcome::result<PolicyDecision> ClaimPolicyEngine::evaluate(
      const VerifiedClaims &claims, const AssetId &asset_id) const {
    std::lock_guard lock{mutex_};
    auto it = requirements_.find(asset_id);
    if (it == requirements_.end()) {
      return PolicyDecision::kAllow;
    }
    for (const auto &[name, value] : it->second) {
      auto claim = claims.claims.find(name);
      if (claim == claims.claims.end() || claim->second != value) {
        return PolicyDecision::kDeny;
      }
    }
    return PolicyDecision::kAllow;
  }
}  // namespace ds::negotiation
