/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_DATASPACE_NODE_BUILDER_HPP
#define CPP_DATASPACE_NODE_BUILDER_HPP

#include <memory>

#include <boost/asio/io_context.hpp>

#include "common/outcome.hpp"
#include "config/engine_config.hpp"
#include "storage/buffer_map.hpp"

// fwd declarations go here
namespace ds {
  namespace clock {
    class UTCClock;
  }  // namespace clock

  namespace claims {
    class ClaimsAuthority;
    class StaticAttestationSource;
  }  // namespace claims

  namespace protocol {
    class Identity;
    class Transport;
    class MessageDispatcher;
    class RetryingSender;
    class ClaimsService;
  }  // namespace protocol

  namespace negotiation {
    class ClaimPolicyEngine;
    class NegotiationEngine;
  }  // namespace negotiation

  namespace signaling {
    class DataPlane;
    class SignalingController;
    class TriggerSource;
  }  // namespace signaling

  namespace transfer {
    class TransferCoordinator;
  }  // namespace transfer
}  // namespace ds

namespace ds::node {

  /// Claim every participant credential carries
  constexpr auto kParticipantClaim{"participant"};

  /**
   * Components of one participant
   */
  struct ParticipantObjects {
    config::EngineConfig config;

    std::shared_ptr<storage::PersistentBufferMap> kvstorage;

    std::shared_ptr<boost::asio::io_context> io_context;

    std::shared_ptr<clock::UTCClock> utc_clock;

    /// entitlements of credential subjects
    std::shared_ptr<claims::StaticAttestationSource> attestation;

    std::shared_ptr<claims::ClaimsAuthority> claims;

    /// PEM public key of own claims authority
    std::string public_key;

    std::shared_ptr<protocol::Identity> identity;

    std::shared_ptr<protocol::Transport> transport;

    std::shared_ptr<protocol::MessageDispatcher> dispatcher;

    std::shared_ptr<protocol::RetryingSender> sender;

    std::shared_ptr<protocol::ClaimsService> claims_service;

    /// asset requirements
    std::shared_ptr<negotiation::ClaimPolicyEngine> policy;

    std::shared_ptr<negotiation::NegotiationEngine> negotiation;

    std::shared_ptr<signaling::DataPlane> data_plane;

    std::shared_ptr<signaling::SignalingController> signaling;

    std::shared_ptr<transfer::TransferCoordinator> transfer;
  };

  /**
   * Wires participant components and issues own credential used as
   * presentation of outbound messages
   * @param config - engine configuration
   * @param transport - channel to other participants
   * @param data_plane - local data plane
   * @param io_context - context running retries
   * @param kvstorage - persistence, in memory storage is used if null
   * @param utc_clock - clock, system clock is used if null
   */
  outcome::result<ParticipantObjects> createParticipantObjects(
      const config::EngineConfig &config,
      std::shared_ptr<protocol::Transport> transport,
      std::shared_ptr<signaling::DataPlane> data_plane,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<storage::PersistentBufferMap> kvstorage = nullptr,
      std::shared_ptr<clock::UTCClock> utc_clock = nullptr);

  /// Makes truster accept jwt issued by trusted participant
  void trust(ParticipantObjects &truster, const ParticipantObjects &trusted);

  /**
   * Routes triggers to transfers, triggers of flows without a transfer go to
   * the signaling controller
   */
  void attachTriggerSource(const ParticipantObjects &objects,
                           signaling::TriggerSource &source);
}  // namespace ds::node

#endif  // CPP_DATASPACE_NODE_BUILDER_HPP
