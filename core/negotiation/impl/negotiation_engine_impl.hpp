/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "claims/claims_authority.hpp"
#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "config/engine_config.hpp"
#include "fsm/fsm.hpp"
#include "negotiation/negotiation_engine.hpp"
#include "negotiation/policy_engine.hpp"
#include "process/lease.hpp"
#include "process/process_store.hpp"
#include "protocol/identity.hpp"
#include "protocol/retrying_sender.hpp"

namespace ds::negotiation {
  using claims::ClaimsAuthority;
  using clock::UTCClock;
  using config::NegotiationConfig;
  using process::LeaseManager;
  using process::ProcessStore;
  using protocol::Identity;
  using protocol::Message;
  using protocol::MessageType;
  using protocol::RetryingSender;
  using storage::PersistentBufferMap;

  class NegotiationEngineImpl
      : public NegotiationEngine,
        public std::enable_shared_from_this<NegotiationEngineImpl> {
   public:
    NegotiationEngineImpl(std::shared_ptr<Identity> identity,
                          NegotiationConfig config,
                          std::chrono::milliseconds lease_wait,
                          std::shared_ptr<ClaimsAuthority> claims,
                          std::shared_ptr<PolicyEngine> policy,
                          std::shared_ptr<RetryingSender> sender,
                          std::shared_ptr<PersistentBufferMap> storage,
                          std::shared_ptr<UTCClock> clock);

    void subscribe(protocol::MessageDispatcher &dispatcher) override;

    outcome::result<ProcessId> requestContract(
        const ParticipantId &provider, const ContractOffer &offer) override;

    outcome::result<void> acceptOffer(const ProcessId &process_id) override;

    outcome::result<void> counterOffer(const ProcessId &process_id,
                                       const ContractOffer &offer) override;

    outcome::result<void> decline(const ProcessId &process_id) override;

    outcome::result<void> agree(const ProcessId &process_id) override;

    outcome::result<void> terminate(const ProcessId &process_id,
                                    TerminationReason reason) override;

    outcome::result<NegotiationProcess> getProcess(
        const ProcessId &process_id) const override;

    outcome::result<NegotiationProcess> findByAgreement(
        const std::string &agreement_id) const override;

    outcome::result<std::vector<NegotiationProcess>> listByState(
        NegotiationState state) const override;

    outcome::result<size_t> terminateStale() override;

   private:
    /** Data passed along with a negotiation event */
    struct NegotiationContext {
      boost::optional<ContractOffer> offer;
      boost::optional<ContractAgreement> agreement;
      TerminationReason reason{TerminationReason::kNone};
      std::string detail;
    };

    using ProcessPtr = std::shared_ptr<NegotiationProcess>;
    using ContextPtr = std::shared_ptr<NegotiationContext>;
    using NegotiationTransition = fsm::Transition<NegotiationEvent,
                                                  NegotiationContext,
                                                  NegotiationState,
                                                  NegotiationProcess>;
    using NegotiationFSM = fsm::FSM<NegotiationEvent,
                                    NegotiationContext,
                                    NegotiationState,
                                    NegotiationProcess>;
    using InboundHandler = outcome::result<void> (NegotiationEngineImpl::*)(
        const ProcessPtr &, const Message &);

    std::vector<NegotiationTransition> makeFSMTransitions();

    /// Appends offer unless offer limit is reached
    outcome::result<void> onOffer(const ProcessPtr &process,
                                  const ContextPtr &context);

    outcome::result<void> onAccept(const ProcessPtr &process,
                                   const ContextPtr &context);

    /// Requires signatures of both parties
    outcome::result<void> onAgree(const ProcessPtr &process,
                                  const ContextPtr &context);

    outcome::result<void> onTerminate(const ProcessPtr &process,
                                      const ContextPtr &context);

    /**
     * Applies event to process in memory
     * @return kInvalidStateTransition or action error
     */
    outcome::result<void> transit(const ProcessPtr &process,
                                  NegotiationEvent event,
                                  ContextPtr context = {});

    outcome::result<ProcessPtr> load(const ProcessId &process_id) const;

    outcome::result<void> save(NegotiationProcess &process);

    Message makeMessage(const NegotiationProcess &process,
                        MessageType type) const;

    /// Sends message to counterparty, exhausted retries terminate process
    outcome::result<void> send(const NegotiationProcess &process,
                               Message message);

    /// Sends message, terminates and saves process if counterparty is
    /// unreachable
    outcome::result<void> sendOrAbort(const ProcessPtr &process,
                                      Message message);

    /**
     * Terminates and saves process, lease must be held
     * @param notify - send termination to counterparty
     */
    outcome::result<void> abort(const ProcessPtr &process,
                                TerminationReason reason,
                                const std::string &detail,
                                bool notify);

    void onExhausted(const ProcessId &process_id);

    /// Sets own offer id and author
    ContractOffer ownOffer(ContractOffer offer) const;

    /// Signature of own party over agreement terms
    outcome::result<std::string> signAgreement(
        const ContractAgreement &agreement);

    outcome::result<void> verifySignature(const ContractAgreement &agreement,
                                          const std::string &signature,
                                          const ParticipantId &signer) const;

    outcome::result<claims::VerifiedClaims> verifySender(
        const Message &message) const;

    /// Provider evaluates policy and replies with offer
    outcome::result<void> offerTo(const ProcessPtr &process,
                                  const claims::VerifiedClaims &requester,
                                  const ContractOffer &requested);

    outcome::result<void> agreeLocked(const ProcessPtr &process);

    /// Finds own process the message is addressed to
    outcome::result<ProcessId> locate(const Message &message) const;

    /// Leases every process id and alias the message may address, in key
    /// order
    outcome::result<std::vector<process::Lease>> leaseAddressed(
        const Message &message);

    /**
     * Applies message to the addressed process under its lease
     * @return acknowledgement, error if the process is leased and the
     * message has to be redelivered
     */
    outcome::result<void> handleInbound(const Message &message,
                                        InboundHandler handler);

    /// Terminates process on definitive failures, logs the rest
    void handleFailure(const ProcessPtr &process,
                       const Message &message,
                       const std::error_code &error);

    outcome::result<void> onContractRequest(const Message &message);

    outcome::result<void> onCounterRequest(const ProcessPtr &process,
                                           const Message &message);
    outcome::result<void> onContractOffer(const ProcessPtr &process,
                                          const Message &message);
    /**
     * Consumer applies AGREED and VERIFIED for one ContractAgreement and
     * answers with a single ContractAgreementVerification, VERIFIED has no
     * message of its own
     */
    outcome::result<void> onContractAgreement(const ProcessPtr &process,
                                              const Message &message);
    /**
     * Provider applies VERIFIED and FINALIZED for one verification and
     * answers with a single FINALIZED event
     */
    outcome::result<void> onAgreementVerification(const ProcessPtr &process,
                                                  const Message &message);
    outcome::result<void> onNegotiationEvent(const ProcessPtr &process,
                                             const Message &message);
    outcome::result<void> onTermination(const ProcessPtr &process,
                                        const Message &message);

    std::shared_ptr<Identity> identity_;
    NegotiationConfig config_;
    std::chrono::milliseconds lease_wait_;
    std::shared_ptr<ClaimsAuthority> claims_;
    std::shared_ptr<PolicyEngine> policy_;
    std::shared_ptr<RetryingSender> sender_;
    ProcessStore<NegotiationProcess> store_;
    std::shared_ptr<UTCClock> clock_;
    LeaseManager leases_;
    std::unique_ptr<NegotiationFSM> fsm_;

    common::Logger logger_;
  };
}  // namespace ds::negotiation
