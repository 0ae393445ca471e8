/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/engine_config.hpp"

namespace ds::config {
  namespace {
    template <typename Duration>
    outcome::result<Duration> getDuration(const Config &config,
                                          const ConfigKey &key,
                                          Duration default_value) {
      OUTCOME_TRY(count,
                  config.get<int64_t>(key, int64_t{default_value.count()}));
      if (count < 0) {
        return ConfigError::kBadValue;
      }
      return Duration{count};
    }
  }  // namespace

  outcome::result<EngineConfig> loadEngineConfig(const Config &config) {
    EngineConfig engine;
    OUTCOME_TRY(participant_id, config.get<std::string>("participant.id"));
    engine.participant_id = participant_id;

    OUTCOME_TRY(max_offers,
                config.get<uint64_t>("negotiation.max_offers",
                                     engine.negotiation.max_offers));
    if (max_offers == 0) {
      return ConfigError::kBadValue;
    }
    engine.negotiation.max_offers = max_offers;
    OUTCOME_TRY(auto_agree,
                config.get<bool>("negotiation.auto_agree",
                                 engine.negotiation.auto_agree));
    engine.negotiation.auto_agree = auto_agree;
    OUTCOME_TRYA(engine.negotiation.timeout,
                 getDuration(config,
                             "negotiation.timeout_sec",
                             engine.negotiation.timeout));

    OUTCOME_TRY(max_attempts,
                config.get<uint64_t>("retry.max_attempts",
                                     engine.retry.max_attempts));
    engine.retry.max_attempts = max_attempts;
    OUTCOME_TRYA(engine.retry.initial_delay,
                 getDuration(config,
                             "retry.initial_delay_ms",
                             engine.retry.initial_delay));
    OUTCOME_TRYA(
        engine.retry.max_delay,
        getDuration(config, "retry.max_delay_ms", engine.retry.max_delay));
    OUTCOME_TRYA(engine.retry.send_timeout,
                 getDuration(config,
                             "retry.send_timeout_ms",
                             engine.retry.send_timeout));
    OUTCOME_TRYA(engine.retry.reply_timeout,
                 getDuration(config,
                             "retry.reply_timeout_ms",
                             engine.retry.reply_timeout));
    if (engine.retry.max_delay < engine.retry.initial_delay) {
      return ConfigError::kBadValue;
    }

    OUTCOME_TRY(issuer,
                config.get<std::string>("claims.issuer", participant_id));
    engine.claims.issuer = issuer;
    OUTCOME_TRY(private_key,
                config.get<std::string>("claims.private_key", {}));
    engine.claims.private_key = private_key;
    OUTCOME_TRYA(
        engine.claims.token_ttl,
        getDuration(config, "claims.token_ttl_sec", engine.claims.token_ttl));
    OUTCOME_TRYA(engine.claims.credential_ttl,
                 getDuration(config,
                             "claims.credential_ttl_sec",
                             engine.claims.credential_ttl));

    OUTCOME_TRYA(engine.lease_wait,
                 getDuration(config, "lease.wait_ms", engine.lease_wait));
    OUTCOME_TRYA(engine.log_level,
                 config.get<std::string>("log.level", engine.log_level));
    return engine;
  }

  outcome::result<EngineConfig> loadEngineConfig(const std::string &filename) {
    Config config;
    OUTCOME_TRY(config.load(filename));
    return loadEngineConfig(config);
  }
}  // namespace ds::config
