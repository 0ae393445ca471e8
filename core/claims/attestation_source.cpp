/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "claims/attestation_source.hpp"

#include "claims/claims_error.hpp"

namespace ds::claims {

  void StaticAttestationSource::entitle(const std::string &subject,
                                        const ClaimSet &claims) {
    std::lock_guard lock{mutex_};
    auto &entitled = entitlements_[subject];
    for (const auto &[name, value] : claims) {
      entitled[name] = value;
    }
  }

  outcome::result<ClaimSet> StaticAttestationSource::attest(
      const std::string &subject, const ClaimSet &requested) const {
    std::lock_guard lock{mutex_};
    auto it = entitlements_.find(subject);
    if (it == entitlements_.end()) {
      return ClaimsError::kIssuanceDenied;
    }
    for (const auto &[name, value] : requested) {
      auto claim = it->second.find(name);
      if (claim == it->second.end() || claim->second != value) {
        return ClaimsError::kIssuanceDenied;
      }
    }
    return requested;
  }
}  // namespace ds::claims
