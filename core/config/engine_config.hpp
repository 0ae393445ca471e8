/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "config/config.hpp"

namespace ds::config {
  using std::chrono::milliseconds;
  using std::chrono::seconds;

  /// Outbound delivery policy for protocol messages
  struct RetryConfig {
    /// retries after the first failed attempt
    uint64_t max_attempts{5};
    milliseconds initial_delay{100};
    milliseconds max_delay{10000};
    /// bound for every single transport call
    milliseconds send_timeout{5000};
    /// bound for awaiting the answer of a credential protocol request
    milliseconds reply_timeout{30000};
  };

  struct NegotiationConfig {
    /// offers in a negotiation (initial and counter offers) before abort
    uint64_t max_offers{5};
    /// provider countersigns agreement as soon as consumer accepted
    bool auto_agree{true};
    seconds timeout{3600};
  };

  struct ClaimsConfig {
    std::string issuer;
    /// PEM P-256 private key of ES256 signatures, generated when empty
    std::string private_key;
    /// PEM public key of private_key, derived when empty
    std::string public_key;
    seconds token_ttl{600};
    seconds credential_ttl{86400};
  };

  /**
   * Typed view over participant configuration
   */
  struct EngineConfig {
    std::string participant_id;
    NegotiationConfig negotiation;
    RetryConfig retry;
    ClaimsConfig claims;
    milliseconds lease_wait{1000};
    /// spdlog level name
    std::string log_level{"info"};
  };

  /**
   * Reads engine configuration, missing optional keys take default values
   * @param config - loaded configuration tree
   * @return engine config or kBadPath if participant.id is absent
   */
  outcome::result<EngineConfig> loadEngineConfig(const Config &config);

  /**
   * Loads configuration file and reads engine configuration from it
   * @param filename - json file
   */
  outcome::result<EngineConfig> loadEngineConfig(const std::string &filename);
}  // namespace ds::config
