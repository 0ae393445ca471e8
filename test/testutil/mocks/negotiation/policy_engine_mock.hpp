/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "negotiation/policy_engine.hpp"

namespace ds::negotiation {
  class PolicyEngineMock : public PolicyEngine {
   public:
    MOCK_CONST_METHOD2(evaluate,
                       outcome::result<PolicyDecision>(const VerifiedClaims &,
                                                       const AssetId &));
  };
}  // namespace ds::negotiation
