/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "claims/claims_authority.hpp"
#include "common/logger.hpp"
#include "fsm/fsm.hpp"
#include "negotiation/negotiation_engine.hpp"
#include "process/lease.hpp"
#include "process/process_store.hpp"
#include "protocol/identity.hpp"
#include "protocol/retrying_sender.hpp"
#include "signaling/signaling_controller.hpp"
#include "transfer/transfer_coordinator.hpp"

namespace ds::transfer {
  using claims::ClaimsAuthority;
  using negotiation::NegotiationEngine;
  using process::LeaseManager;
  using process::ProcessStore;
  using protocol::Identity;
  using protocol::Message;
  using protocol::MessageType;
  using protocol::RetryingSender;
  using signaling::SignalingController;
  using storage::PersistentBufferMap;

  class TransferCoordinatorImpl
      : public TransferCoordinator,
        public std::enable_shared_from_this<TransferCoordinatorImpl> {
   public:
    TransferCoordinatorImpl(std::shared_ptr<Identity> identity,
                            std::chrono::milliseconds lease_wait,
                            std::shared_ptr<ClaimsAuthority> claims,
                            std::shared_ptr<NegotiationEngine> negotiation,
                            std::shared_ptr<SignalingController> signaling,
                            std::shared_ptr<RetryingSender> sender,
                            std::shared_ptr<PersistentBufferMap> storage);

    void subscribe(protocol::MessageDispatcher &dispatcher) override;

    outcome::result<StartedTransfer> requestTransfer(
        const std::string &agreement_id,
        TransferType type,
        const DataAddress &address) override;

    outcome::result<ProcessId> openTransfer(
        const std::string &agreement_id,
        TransferType type,
        const DataAddress &address) override;

    outcome::result<void> suspend(const ProcessId &process_id) override;

    outcome::result<boost::optional<Edr>> resume(
        const ProcessId &process_id) override;

    outcome::result<void> terminate(const ProcessId &process_id,
                                    TerminationReason reason) override;

    outcome::result<void> complete(const ProcessId &process_id) override;

    outcome::result<void> handleTrigger(
        const signaling::Trigger &trigger) override;

    outcome::result<TransferProcess> getProcess(
        const ProcessId &process_id) const override;

    outcome::result<std::vector<TransferProcess>> listByState(
        TransferState state) const override;

   private:
    /** Data passed along with a transfer event */
    struct TransferContext {
      /// reference delivered by the start
      boost::optional<Edr> edr;
      /// live token of the local data flow
      std::string token_id;
      TerminationReason reason{TerminationReason::kNone};
      std::string detail;
    };

    using ProcessPtr = std::shared_ptr<TransferProcess>;
    using ContextPtr = std::shared_ptr<TransferContext>;
    using TransferTransition = fsm::Transition<TransferEvent,
                                               TransferContext,
                                               TransferState,
                                               TransferProcess>;
    using TransferFSM = fsm::
        FSM<TransferEvent, TransferContext, TransferState, TransferProcess>;
    using InboundHandler = outcome::result<void> (TransferCoordinatorImpl::*)(
        const ProcessPtr &, const Message &);

    std::vector<TransferTransition> makeFSMTransitions();

    /// Records pull endpoint of the start
    outcome::result<void> onStart(const ProcessPtr &process,
                                  const ContextPtr &context);

    /// Drops reference to the revoked token
    outcome::result<void> onSuspend(const ProcessPtr &process,
                                    const ContextPtr &context);

    outcome::result<void> onEnd(const ProcessPtr &process,
                                const ContextPtr &context);

    /**
     * Applies event to process in memory
     * @return kInvalidStateTransition or action error
     */
    outcome::result<void> transit(const ProcessPtr &process,
                                  TransferEvent event,
                                  ContextPtr context = {});

    outcome::result<ProcessPtr> load(const ProcessId &process_id) const;

    outcome::result<void> save(const TransferProcess &process);

    /**
     * Finds finalized negotiation of the agreement
     * @return negotiation or kContractNotAgreed
     */
    outcome::result<negotiation::NegotiationProcess> agreed(
        const std::string &agreement_id) const;

    Message makeMessage(const TransferProcess &process,
                        MessageType type) const;

    /// Counterparty knows the process and can be notified
    bool notifiable(const TransferProcess &process) const;

    outcome::result<void> send(const TransferProcess &process,
                               Message message);

    /// Sends message, terminates and saves process if counterparty is
    /// unreachable
    outcome::result<void> sendOrAbort(const ProcessPtr &process,
                                      Message message);

    /// TransferStart carrying the reference of a pull transfer
    Message startMessage(const TransferProcess &process,
                         const boost::optional<Edr> &edr) const;

    /**
     * Starts or resumes local data flow and mirrors it, lease must be held.
     * Process is not saved.
     */
    outcome::result<boost::optional<Edr>> startFlow(const ProcessPtr &process);

    /// Suspends and saves process, lease must be held
    outcome::result<void> suspendLocked(const ProcessPtr &process,
                                        bool notify);

    /// Ends and saves process, lease must be held
    outcome::result<void> terminateLocked(const ProcessPtr &process,
                                          TerminationReason reason,
                                          const std::string &detail,
                                          bool notify);

    void onExhausted(const ProcessId &process_id);

    outcome::result<claims::VerifiedClaims> verifySender(
        const Message &message) const;

    /// Finds own process the message is addressed to
    outcome::result<ProcessId> locate(const Message &message) const;

    /// Leases every process id and alias the message may address
    outcome::result<std::vector<process::Lease>> leaseAddressed(
        const Message &message);

    /// Applies message under the process lease, an error asks the sender to
    /// redeliver
    outcome::result<void> handleInbound(const Message &message,
                                        InboundHandler handler);

    /// Terminates process on definitive failures, logs the rest
    void handleFailure(const ProcessPtr &process,
                       const Message &message,
                       const std::error_code &error);

    /// Replies with termination to a request no process was created for
    void reject(const Message &message,
                TerminationReason reason,
                const std::string &detail);

    outcome::result<void> onTransferRequest(const Message &message);

    outcome::result<void> onTransferStart(const ProcessPtr &process,
                                          const Message &message);
    outcome::result<void> onTransferSuspension(const ProcessPtr &process,
                                               const Message &message);
    outcome::result<void> onTransferCompletion(const ProcessPtr &process,
                                               const Message &message);
    outcome::result<void> onTransferTermination(const ProcessPtr &process,
                                                const Message &message);

    std::shared_ptr<Identity> identity_;
    std::chrono::milliseconds lease_wait_;
    std::shared_ptr<ClaimsAuthority> claims_;
    std::shared_ptr<NegotiationEngine> negotiation_;
    std::shared_ptr<SignalingController> signaling_;
    std::shared_ptr<RetryingSender> sender_;
    ProcessStore<TransferProcess> store_;
    LeaseManager leases_;
    std::unique_ptr<TransferFSM> fsm_;

    common::Logger logger_;
  };
}  // namespace ds::transfer
