/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/builder.hpp"

#include "claims/impl/claims_authority_impl.hpp"
#include "claims/signing_key.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "common/logger.hpp"
#include "config/config_error.hpp"
#include "negotiation/impl/negotiation_engine_impl.hpp"
#include "process/process_store_error.hpp"
#include "protocol/claims_service.hpp"
#include "signaling/impl/signaling_controller_impl.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "transfer/impl/transfer_coordinator_impl.hpp"

namespace ds::node {

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger.get();
    }
  }  // namespace

  outcome::result<ParticipantObjects> createParticipantObjects(
      const config::EngineConfig &config,
      std::shared_ptr<protocol::Transport> transport,
      std::shared_ptr<signaling::DataPlane> data_plane,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<storage::PersistentBufferMap> kvstorage,
      std::shared_ptr<clock::UTCClock> utc_clock) {
    if (!common::setLogLevel(config.log_level)) {
      log()->error("Unknown log level {}", config.log_level);
      return config::ConfigError::kBadValue;
    }

    ParticipantObjects o;
    o.config = config;

    o.kvstorage = std::move(kvstorage);
    if (!o.kvstorage) {
      o.kvstorage = std::make_shared<storage::InMemoryStorage>();
    }
    o.io_context = std::move(io_context);
    o.utc_clock = std::move(utc_clock);
    if (!o.utc_clock) {
      o.utc_clock = std::make_shared<clock::UTCClockImpl>();
    }

    auto claims_config = config.claims;
    if (claims_config.private_key.empty()) {
      OUTCOME_TRY(key, claims::generateSigningKey());
      claims_config.private_key = key.private_key;
      claims_config.public_key = key.public_key;
    } else if (claims_config.public_key.empty()) {
      OUTCOME_TRYA(claims_config.public_key,
                   claims::derivePublicKey(claims_config.private_key));
    }
    o.public_key = claims_config.public_key;
    o.attestation = std::make_shared<claims::StaticAttestationSource>();
    o.claims = std::make_shared<claims::ClaimsAuthorityImpl>(
        claims_config, o.utc_clock, o.kvstorage, o.attestation);

    o.identity = std::make_shared<protocol::Identity>(config.participant_id);
    const claims::ClaimSet membership{
        {kParticipantClaim, config.participant_id}};
    o.attestation->entitle(config.participant_id, membership);
    OUTCOME_TRY(credential,
                o.claims->issueCredential(config.participant_id, membership));
    o.identity->setPresentation(credential.signature);

    o.transport = std::move(transport);
    o.dispatcher = std::make_shared<protocol::MessageDispatcher>();
    o.dispatcher->attach(*o.transport);
    o.sender = std::make_shared<protocol::RetryingSender>(
        o.transport, o.io_context, o.identity, config.retry);

    o.claims_service = std::make_shared<protocol::ClaimsService>(
        o.claims, o.sender, o.io_context, config.retry.reply_timeout);
    o.claims_service->subscribe(*o.dispatcher);

    o.policy = std::make_shared<negotiation::ClaimPolicyEngine>();
    auto engine = std::make_shared<negotiation::NegotiationEngineImpl>(
        o.identity,
        config.negotiation,
        config.lease_wait,
        o.claims,
        o.policy,
        o.sender,
        o.kvstorage,
        o.utc_clock);
    engine->subscribe(*o.dispatcher);
    o.negotiation = engine;

    o.data_plane = std::move(data_plane);
    o.signaling = std::make_shared<signaling::SignalingControllerImpl>(
        o.claims, o.data_plane, o.kvstorage, config.lease_wait);

    auto coordinator = std::make_shared<transfer::TransferCoordinatorImpl>(
        o.identity,
        config.lease_wait,
        o.claims,
        o.negotiation,
        o.signaling,
        o.sender,
        o.kvstorage);
    coordinator->subscribe(*o.dispatcher);
    o.transfer = coordinator;

    log()->info("Participant {} ready, issuer {}",
                config.participant_id,
                o.claims->issuer());
    return o;
  }

  void trust(ParticipantObjects &truster, const ParticipantObjects &trusted) {
    truster.claims->addTrustedIssuer(trusted.claims->issuer(),
                                     trusted.public_key);
    log()->debug("Participant {} trusts issuer {}",
                 truster.config.participant_id,
                 trusted.claims->issuer());
  }

  void attachTriggerSource(const ParticipantObjects &objects,
                           signaling::TriggerSource &source) {
    std::weak_ptr<transfer::TransferCoordinator> weak_transfer{
        objects.transfer};
    std::weak_ptr<signaling::SignalingController> weak_signaling{
        objects.signaling};
    source.setHandler([weak_transfer,
                       weak_signaling](const signaling::Trigger &trigger) {
      auto transfer = weak_transfer.lock();
      auto signaling = weak_signaling.lock();
      if (!transfer || !signaling) {
        return;
      }
      auto handled = transfer->handleTrigger(trigger);
      if (!handled
          && handled.error() == process::ProcessStoreError::kNotFound) {
        handled = signaling->handleTrigger(trigger);
      }
      if (!handled) {
        log()->error("Trigger on {} failed: {}",
                     signaling::decide(trigger).process_id,
                     handled.error().message());
      }
    });
  }
}  // namespace ds::node
