/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/impl/transfer_coordinator_impl.hpp"

#include <set>

#include "claims/claims_error.hpp"
#include "common/uuid.hpp"
#include "fsm/error.hpp"
#include "process/process_store_error.hpp"
#include "protocol/protocol_error.hpp"
#include "signaling/signaling_error.hpp"
#include "transfer/transfer_error.hpp"

#define CALLBACK_ACTION(_action)                                         \
  [this](auto process, auto event, auto context, auto from, auto to) {   \
    logger_->debug("Transfer {} " #_action, process->id);                \
    return _action(process, context);                                    \
  }

namespace ds::transfer {
  using claims::Presentation;
  using negotiation::NegotiationProcess;
  using negotiation::NegotiationRole;
  using negotiation::NegotiationState;
  using process::ProcessStoreError;
  using protocol::ProtocolError;
  using signaling::SignalingError;

  namespace {
    std::string requestAlias(const ParticipantId &consumer,
                             const ProcessId &consumer_pid) {
      return "request/" + consumer + "/" + consumer_pid;
    }

    /// Pull source of an asset served by the local data plane
    DataAddress assetAddress(const std::string &asset_id) {
      return DataAddress{"Asset", asset_id, {}};
    }
  }  // namespace

  TransferCoordinatorImpl::TransferCoordinatorImpl(
      std::shared_ptr<Identity> identity,
      std::chrono::milliseconds lease_wait,
      std::shared_ptr<ClaimsAuthority> claims,
      std::shared_ptr<NegotiationEngine> negotiation,
      std::shared_ptr<SignalingController> signaling,
      std::shared_ptr<RetryingSender> sender,
      std::shared_ptr<PersistentBufferMap> storage)
      : identity_{std::move(identity)},
        lease_wait_{lease_wait},
        claims_{std::move(claims)},
        negotiation_{std::move(negotiation)},
        signaling_{std::move(signaling)},
        sender_{std::move(sender)},
        store_{std::move(storage), "transfer"},
        logger_{common::createLogger("transfer")} {
    fsm_ = std::make_unique<TransferFSM>(makeFSMTransitions());
    fsm_->setAnyChangeAction([this](auto process, auto, auto from, auto to) {
      logger_->debug("Transfer {} {} -> {}",
                     process->id,
                     toString(from),
                     toString(to));
    });
  }

  void TransferCoordinatorImpl::subscribe(
      protocol::MessageDispatcher &dispatcher) {
    std::weak_ptr<TransferCoordinatorImpl> weak{shared_from_this()};
    auto bind = [weak](InboundHandler handler) {
      return [weak,
              handler](const Message &message) -> outcome::result<void> {
        if (auto self = weak.lock()) {
          return self->handleInbound(message, handler);
        }
        return outcome::success();
      };
    };
    dispatcher.subscribe(
        MessageType::kTransferRequest,
        [weak](const Message &message) -> outcome::result<void> {
          if (auto self = weak.lock()) {
            return self->onTransferRequest(message);
          }
          return outcome::success();
        });
    dispatcher.subscribe(MessageType::kTransferStart,
                         bind(&TransferCoordinatorImpl::onTransferStart));
    dispatcher.subscribe(MessageType::kTransferSuspension,
                         bind(&TransferCoordinatorImpl::onTransferSuspension));
    dispatcher.subscribe(MessageType::kTransferCompletion,
                         bind(&TransferCoordinatorImpl::onTransferCompletion));
    dispatcher.subscribe(
        MessageType::kTransferTermination,
        bind(&TransferCoordinatorImpl::onTransferTermination));
  }

  outcome::result<StartedTransfer> TransferCoordinatorImpl::requestTransfer(
      const std::string &agreement_id,
      TransferType type,
      const DataAddress &address) {
    OUTCOME_TRY(negotiation, agreed(agreement_id));

    auto process = std::make_shared<TransferProcess>();
    process->id = common::generateUuid();
    process->role = TransferRole::kProvider;
    process->agreement_id = agreement_id;
    process->type = type;
    process->counterparty_id = negotiation.counterparty_id;
    process->address = address;

    OUTCOME_TRY(lease, leases_.acquire(process->id, lease_wait_));
    auto started = startFlow(process);
    if (!started) {
      logger_->error("Transfer {} of agreement {} not started: {}",
                     process->id,
                     agreement_id,
                     started.error().message());
      auto context = std::make_shared<TransferContext>();
      context->reason = TerminationReason::kSystemError;
      context->detail = started.error().message();
      OUTCOME_TRY(transit(process, TransferEvent::kTerminate, context));
      OUTCOME_TRY(save(*process));
      return started.error();
    }

    auto saved = save(*process);
    if (!saved) {
      auto ended =
          signaling_->terminate(process->id, TerminationReason::kSystemError);
      if (!ended) {
        logger_->error("Data flow of transfer {} left running: {}",
                       process->id,
                       ended.error().message());
      }
      return saved.error();
    }
    logger_->info("Transfer {} of agreement {} started as {}",
                  process->id,
                  agreement_id,
                  primitives::toString(type));
    return StartedTransfer{process->id, started.value()};
  }

  outcome::result<ProcessId> TransferCoordinatorImpl::openTransfer(
      const std::string &agreement_id,
      TransferType type,
      const DataAddress &address) {
    OUTCOME_TRY(negotiation, agreed(agreement_id));
    if (negotiation.role != NegotiationRole::kConsumer) {
      return TransferError::kWrongRole;
    }

    auto process = std::make_shared<TransferProcess>();
    process->id = common::generateUuid();
    process->role = TransferRole::kConsumer;
    process->agreement_id = agreement_id;
    process->type = type;
    process->counterparty_id = negotiation.counterparty_id;
    if (type == TransferType::kPush) {
      process->address = address;
    }

    OUTCOME_TRY(lease, leases_.acquire(process->id, lease_wait_));
    auto message = makeMessage(*process, MessageType::kTransferRequest);
    message.agreement_id = agreement_id;
    message.transfer_type = type;
    if (type == TransferType::kPush) {
      message.data_address = address;
    }
    OUTCOME_TRY(send(*process, std::move(message)));
    OUTCOME_TRY(save(*process));
    logger_->info("Transfer {} of agreement {} requested from {}",
                  process->id,
                  agreement_id,
                  process->counterparty_id);
    return process->id;
  }

  outcome::result<void> TransferCoordinatorImpl::suspend(
      const ProcessId &process_id) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    return suspendLocked(process, true);
  }

  outcome::result<boost::optional<Edr>> TransferCoordinatorImpl::resume(
      const ProcessId &process_id) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    if (process->state != TransferState::kSuspended
        && process->state != TransferState::kStarted) {
      logger_->warn("Resume of transfer {} in state {}",
                    process->id,
                    toString(process->state));
      return TransferError::kInvalidStateTransition;
    }

    if (process->role == TransferRole::kConsumer) {
      // provider answers with TransferStart carrying the new reference
      OUTCOME_TRY(sendOrAbort(
          process, makeMessage(*process, MessageType::kTransferStart)));
      return boost::none;
    }

    OUTCOME_TRY(edr, startFlow(process));
    if (notifiable(*process)) {
      OUTCOME_TRY(sendOrAbort(process, startMessage(*process, edr)));
    }
    OUTCOME_TRY(save(*process));
    return edr;
  }

  outcome::result<void> TransferCoordinatorImpl::terminate(
      const ProcessId &process_id, TerminationReason reason) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    return terminateLocked(process, reason, "", true);
  }

  outcome::result<void> TransferCoordinatorImpl::complete(
      const ProcessId &process_id) {
    return terminate(process_id, TerminationReason::kCompleted);
  }

  outcome::result<void> TransferCoordinatorImpl::handleTrigger(
      const signaling::Trigger &trigger) {
    auto decision = signaling::decide(trigger);
    OUTCOME_TRY(lease, leases_.acquire(decision.process_id, lease_wait_));
    OUTCOME_TRY(process, load(decision.process_id));
    logger_->info("Trigger on transfer {}: {}",
                  process->id,
                  decision.suspend ? std::string{"suspend"}
                                   : primitives::toString(decision.reason));
    if (decision.suspend) {
      return suspendLocked(process, true);
    }
    return terminateLocked(process, decision.reason, "", true);
  }

  outcome::result<TransferProcess> TransferCoordinatorImpl::getProcess(
      const ProcessId &process_id) const {
    return store_.load(process_id);
  }

  outcome::result<std::vector<TransferProcess>>
  TransferCoordinatorImpl::listByState(TransferState state) const {
    return store_.listByState(state);
  }

  std::vector<TransferCoordinatorImpl::TransferTransition>
  TransferCoordinatorImpl::makeFSMTransitions() {
    return {TransferTransition(TransferEvent::kProvision)
                .from(TransferState::kRequested)
                .to(TransferState::kProvisioned)
                .action(CALLBACK_ACTION(onStart)),
            TransferTransition(TransferEvent::kStart)
                .fromMany(TransferState::kProvisioned,
                          TransferState::kSuspended)
                .to(TransferState::kStarted)
                .from(TransferState::kStarted)
                .toSameState()
                .action(CALLBACK_ACTION(onStart)),
            TransferTransition(TransferEvent::kSuspend)
                .from(TransferState::kStarted)
                .to(TransferState::kSuspended)
                .action(CALLBACK_ACTION(onSuspend)),
            TransferTransition(TransferEvent::kComplete)
                .fromMany(TransferState::kStarted, TransferState::kSuspended)
                .to(TransferState::kCompleted)
                .action(CALLBACK_ACTION(onEnd)),
            TransferTransition(TransferEvent::kTerminate)
                .fromMany(TransferState::kRequested,
                          TransferState::kProvisioned,
                          TransferState::kStarted,
                          TransferState::kSuspended)
                .to(TransferState::kTerminated)
                .action(CALLBACK_ACTION(onEnd))};
  }

  outcome::result<void> TransferCoordinatorImpl::onStart(
      const ProcessPtr &process, const ContextPtr &context) {
    process->endpoint = {};
    process->token.clear();
    process->token_id.clear();
    if (!context) {
      return outcome::success();
    }
    if (context->edr) {
      process->endpoint = context->edr->endpoint;
      if (process->role == TransferRole::kConsumer) {
        process->token = context->edr->token;
      }
    }
    if (process->role == TransferRole::kProvider) {
      process->token_id = context->token_id;
    }
    return outcome::success();
  }

  outcome::result<void> TransferCoordinatorImpl::onSuspend(
      const ProcessPtr &process, const ContextPtr &) {
    process->endpoint = {};
    process->token.clear();
    process->token_id.clear();
    return outcome::success();
  }

  outcome::result<void> TransferCoordinatorImpl::onEnd(
      const ProcessPtr &process, const ContextPtr &context) {
    process->endpoint = {};
    process->token.clear();
    process->token_id.clear();
    if (context) {
      process->termination_reason = context->reason;
      process->message = context->detail;
    }
    return outcome::success();
  }

  outcome::result<void> TransferCoordinatorImpl::transit(
      const ProcessPtr &process, TransferEvent event, ContextPtr context) {
    auto applied = fsm_->dispatch(process, event, std::move(context));
    if (!applied) {
      if (applied.error() == fsm::FsmError::kInvalidTransition) {
        logger_->warn("Transfer {} rejected event in state {}",
                      process->id,
                      toString(process->state));
        return TransferError::kInvalidStateTransition;
      }
      return applied.error();
    }
    return outcome::success();
  }

  outcome::result<TransferCoordinatorImpl::ProcessPtr>
  TransferCoordinatorImpl::load(const ProcessId &process_id) const {
    OUTCOME_TRY(process, store_.load(process_id));
    return std::make_shared<TransferProcess>(std::move(process));
  }

  outcome::result<void> TransferCoordinatorImpl::save(
      const TransferProcess &process) {
    auto saved = store_.save(process);
    if (!saved) {
      logger_->error("Transfer {} in state {} not saved: {}",
                     process.id,
                     toString(process.state),
                     saved.error().message());
    }
    return saved;
  }

  outcome::result<NegotiationProcess> TransferCoordinatorImpl::agreed(
      const std::string &agreement_id) const {
    auto found = negotiation_->findByAgreement(agreement_id);
    if (!found) {
      logger_->warn("Transfer of unknown agreement {}", agreement_id);
      return TransferError::kContractNotAgreed;
    }
    if (found.value().state != NegotiationState::kFinalized) {
      logger_->warn("Transfer of agreement {} negotiated in state {}",
                    agreement_id,
                    negotiation::toString(found.value().state));
      return TransferError::kContractNotAgreed;
    }
    return found;
  }

  Message TransferCoordinatorImpl::makeMessage(const TransferProcess &process,
                                               MessageType type) const {
    Message message;
    message.type = type;
    if (process.role == TransferRole::kConsumer) {
      message.consumer_pid = process.id;
      message.provider_pid = process.counterparty_pid;
    } else {
      message.consumer_pid = process.counterparty_pid;
      message.provider_pid = process.id;
    }
    return message;
  }

  bool TransferCoordinatorImpl::notifiable(
      const TransferProcess &process) const {
    if (process.counterparty_id.empty()) {
      return false;
    }
    // provider locates consumer requests by consumer pid alone
    return process.role == TransferRole::kConsumer
           || !process.counterparty_pid.empty();
  }

  outcome::result<void> TransferCoordinatorImpl::send(
      const TransferProcess &process, Message message) {
    std::weak_ptr<TransferCoordinatorImpl> weak{shared_from_this()};
    OUTCOME_TRY(sender_->send(
        process.counterparty_id,
        process.id,
        std::move(message),
        [weak](const ProcessId &process_id, const Message &) {
          if (auto self = weak.lock()) {
            self->onExhausted(process_id);
          }
        }));
    return outcome::success();
  }

  outcome::result<void> TransferCoordinatorImpl::sendOrAbort(
      const ProcessPtr &process, Message message) {
    auto sent = send(*process, std::move(message));
    if (!sent && sent.error() == ProtocolError::kCounterpartyUnreachable) {
      auto ended = terminateLocked(process,
                                   TerminationReason::kCounterpartyUnreachable,
                                   sent.error().message(),
                                   false);
      if (!ended) {
        logger_->error("Transfer {} not terminated: {}",
                       process->id,
                       ended.error().message());
      }
    }
    return sent;
  }

  Message TransferCoordinatorImpl::startMessage(
      const TransferProcess &process, const boost::optional<Edr> &edr) const {
    auto message = makeMessage(process, MessageType::kTransferStart);
    if (edr) {
      message.data_address = edr->endpoint;
      message.token = edr->token;
    }
    return message;
  }

  outcome::result<boost::optional<Edr>> TransferCoordinatorImpl::startFlow(
      const ProcessPtr &process) {
    const auto provision = process->state == TransferState::kRequested;
    if (!fsm_->accepts(process->state,
                       provision ? TransferEvent::kProvision
                                 : TransferEvent::kStart)) {
      logger_->warn("Start of transfer {} in state {}",
                    process->id,
                    toString(process->state));
      return TransferError::kInvalidStateTransition;
    }
    OUTCOME_TRY(edr,
                signaling_->start(process->id, process->type, process->address));
    OUTCOME_TRY(flow, signaling_->getFlow(process->id));

    auto context = std::make_shared<TransferContext>();
    context->edr = edr;
    context->token_id = flow.token_id;
    if (provision) {
      OUTCOME_TRY(transit(process, TransferEvent::kProvision, context));
    }
    OUTCOME_TRY(transit(process, TransferEvent::kStart, context));
    return edr;
  }

  outcome::result<void> TransferCoordinatorImpl::suspendLocked(
      const ProcessPtr &process, bool notify) {
    if (!fsm_->accepts(process->state, TransferEvent::kSuspend)) {
      logger_->warn("Suspend of transfer {} in state {}",
                    process->id,
                    toString(process->state));
      return TransferError::kInvalidStateTransition;
    }
    if (process->role == TransferRole::kProvider) {
      OUTCOME_TRY(signaling_->suspend(process->id));
    }
    OUTCOME_TRY(transit(process, TransferEvent::kSuspend));
    if (notify && notifiable(*process)) {
      OUTCOME_TRY(sendOrAbort(
          process, makeMessage(*process, MessageType::kTransferSuspension)));
    }
    return save(*process);
  }

  outcome::result<void> TransferCoordinatorImpl::terminateLocked(
      const ProcessPtr &process,
      TerminationReason reason,
      const std::string &detail,
      bool notify) {
    if (isTerminal(process->state)) {
      return outcome::success();
    }
    const auto completed = reason == TerminationReason::kCompleted;
    const auto event =
        completed ? TransferEvent::kComplete : TransferEvent::kTerminate;
    if (!fsm_->accepts(process->state, event)) {
      logger_->warn("{} of transfer {} in state {}",
                    completed ? "Completion" : "Termination",
                    process->id,
                    toString(process->state));
      return TransferError::kInvalidStateTransition;
    }

    sender_->cancel(process->id);
    if (process->role == TransferRole::kProvider
        && process->state != TransferState::kRequested) {
      OUTCOME_TRY(signaling_->terminate(process->id, reason));
    }
    auto context = std::make_shared<TransferContext>();
    context->reason = reason;
    context->detail = detail;
    OUTCOME_TRY(transit(process, event, context));
    logger_->info("Transfer {} ended: {}",
                  process->id,
                  primitives::toString(reason));

    if (notify && notifiable(*process)) {
      auto message = makeMessage(*process,
                                 completed ? MessageType::kTransferCompletion
                                           : MessageType::kTransferTermination);
      if (!completed) {
        message.reason = reason;
        if (!detail.empty()) {
          message.detail = detail;
        }
      }
      auto sent = send(*process, std::move(message));
      if (!sent) {
        logger_->warn("End of transfer {} not sent to {}: {}",
                      process->id,
                      process->counterparty_id,
                      sent.error().message());
      }
    }
    return save(*process);
  }

  void TransferCoordinatorImpl::onExhausted(const ProcessId &process_id) {
    auto lease = leases_.acquire(process_id, lease_wait_);
    if (!lease) {
      logger_->error("Transfer {} lease: {}",
                     process_id,
                     lease.error().message());
      return;
    }
    auto process = load(process_id);
    if (!process) {
      logger_->error("Transfer {} load: {}",
                     process_id,
                     process.error().message());
      return;
    }
    auto ended = terminateLocked(process.value(),
                                 TerminationReason::kCounterpartyUnreachable,
                                 "retries exhausted",
                                 false);
    if (!ended) {
      logger_->error("Transfer {} not terminated: {}",
                     process_id,
                     ended.error().message());
    }
  }

  outcome::result<claims::VerifiedClaims> TransferCoordinatorImpl::verifySender(
      const Message &message) const {
    return claims_->verifyPresentation(
        Presentation{message.sender, message.presentation});
  }

  outcome::result<ProcessId> TransferCoordinatorImpl::locate(
      const Message &message) const {
    auto addressed = [&](const ProcessId &process_id, TransferRole role) {
      if (process_id.empty()) {
        return false;
      }
      auto process = store_.load(process_id);
      return process && process.value().role == role
             && process.value().counterparty_id == message.sender;
    };
    if (addressed(message.provider_pid, TransferRole::kProvider)) {
      return message.provider_pid;
    }
    if (addressed(message.consumer_pid, TransferRole::kConsumer)) {
      return message.consumer_pid;
    }
    auto requested =
        store_.resolve(requestAlias(message.sender, message.consumer_pid));
    if (requested && addressed(requested.value(), TransferRole::kProvider)) {
      return requested.value();
    }
    return ProcessStoreError::kNotFound;
  }

  outcome::result<std::vector<process::Lease>>
  TransferCoordinatorImpl::leaseAddressed(const Message &message) {
    std::set<std::string> keys;
    if (!message.consumer_pid.empty()) {
      keys.insert(message.consumer_pid);
    }
    if (!message.provider_pid.empty()) {
      keys.insert(message.provider_pid);
    } else {
      keys.insert(requestAlias(message.sender, message.consumer_pid));
    }
    std::vector<process::Lease> leases;
    for (const auto &key : keys) {
      OUTCOME_TRY(lease, leases_.acquire(key, lease_wait_));
      leases.push_back(std::move(lease));
    }
    return leases;
  }

  outcome::result<void> TransferCoordinatorImpl::handleInbound(
      const Message &message, InboundHandler handler) {
    auto leases = leaseAddressed(message);
    if (!leases) {
      logger_->warn("{} {} from {} not acknowledged: {}",
                    toString(message.type),
                    message.message_id,
                    message.sender,
                    leases.error().message());
      return leases.error();
    }
    auto process_id = locate(message);
    if (!process_id) {
      logger_->warn("{} {} from {} for unknown transfer",
                    toString(message.type),
                    message.message_id,
                    message.sender);
      return outcome::success();
    }
    auto loaded = load(process_id.value());
    if (!loaded) {
      logger_->error("Transfer {} load: {}",
                     process_id.value(),
                     loaded.error().message());
      return loaded.error();
    }
    auto process = loaded.value();
    if (process->processed_messages.count(message.message_id) != 0) {
      logger_->debug("Duplicate {} {} for transfer {}",
                     toString(message.type),
                     message.message_id,
                     process->id);
      return outcome::success();
    }
    if (isTerminal(process->state)) {
      logger_->warn("{} {} for transfer {} in state {} ignored",
                    toString(message.type),
                    message.message_id,
                    process->id,
                    toString(process->state));
      return outcome::success();
    }

    auto verified = verifySender(message);
    if (!verified) {
      handleFailure(process, message, verified.error());
      return outcome::success();
    }
    auto handled = ((*this).*handler)(process, message);
    if (!handled) {
      handleFailure(process, message, handled.error());
      return outcome::success();
    }
    process->processed_messages.insert(message.message_id);
    OUTCOME_TRY(save(*process));
    logger_->debug("{} {} applied to transfer {}",
                   toString(message.type),
                   message.message_id,
                   process->id);
    return outcome::success();
  }

  void TransferCoordinatorImpl::handleFailure(const ProcessPtr &process,
                                              const Message &message,
                                              const std::error_code &error) {
    if (error == TransferError::kInvalidStateTransition
        || error == TransferError::kMalformedMessage
        || error == TransferError::kWrongRole
        || error == SignalingError::kInvalidStateTransition) {
      logger_->warn("{} {} for transfer {} in state {} rejected: {}",
                    toString(message.type),
                    message.message_id,
                    process->id,
                    toString(process->state),
                    error.message());
      return;
    }
    logger_->error("{} {} for transfer {} in state {} failed: {}",
                   toString(message.type),
                   message.message_id,
                   process->id,
                   toString(process->state),
                   error.message());

    auto reason = TerminationReason::kSystemError;
    bool notify = true;
    if (claims::isVerificationFailure(error)) {
      reason = TerminationReason::kVerificationFailed;
    } else if (error == ProtocolError::kCounterpartyUnreachable) {
      reason = TerminationReason::kCounterpartyUnreachable;
      notify = false;
    }
    process->processed_messages.insert(message.message_id);
    auto ended = terminateLocked(process, reason, error.message(), notify);
    if (!ended) {
      logger_->error("Transfer {} not terminated: {}",
                     process->id,
                     ended.error().message());
    }
  }

  void TransferCoordinatorImpl::reject(const Message &message,
                                       TerminationReason reason,
                                       const std::string &detail) {
    Message reply;
    reply.type = MessageType::kTransferTermination;
    reply.consumer_pid = message.consumer_pid;
    reply.reason = reason;
    reply.detail = detail;
    auto sent = sender_->send(message.sender, message.consumer_pid, reply, {});
    if (!sent) {
      logger_->warn("Rejection of TransferRequest {} not sent to {}: {}",
                    message.message_id,
                    message.sender,
                    sent.error().message());
    }
  }

  outcome::result<void> TransferCoordinatorImpl::onTransferRequest(
      const Message &message) {
    if (!message.agreement_id || !message.transfer_type
        || message.consumer_pid.empty()) {
      logger_->warn("TransferRequest {} from {} without agreement",
                    message.message_id,
                    message.sender);
      return outcome::success();
    }
    const auto alias = requestAlias(message.sender, message.consumer_pid);
    {
      auto lease = leases_.acquire(alias, lease_wait_);
      if (!lease) {
        logger_->warn("TransferRequest {} not acknowledged: {}",
                      message.message_id,
                      lease.error().message());
        return lease.error();
      }
      if (!store_.resolve(alias)) {
        auto verified = verifySender(message);
        if (!verified) {
          logger_->error("TransferRequest {} from {} not verified: {}",
                         message.message_id,
                         message.sender,
                         verified.error().message());
          reject(message,
                 TerminationReason::kVerificationFailed,
                 verified.error().message());
          return outcome::success();
        }
        auto negotiation = agreed(*message.agreement_id);
        if (!negotiation
            || negotiation.value().role != NegotiationRole::kProvider
            || negotiation.value().counterparty_id != message.sender) {
          logger_->warn("TransferRequest {} from {} for agreement {} denied",
                        message.message_id,
                        message.sender,
                        *message.agreement_id);
          reject(message,
                 TerminationReason::kPolicyDenied,
                 make_error_code(TransferError::kContractNotAgreed).message());
          return outcome::success();
        }

        auto process = std::make_shared<TransferProcess>();
        process->id = common::generateUuid();
        process->role = TransferRole::kProvider;
        process->agreement_id = *message.agreement_id;
        process->type = *message.transfer_type;
        process->counterparty_id = message.sender;
        process->counterparty_pid = message.consumer_pid;
        process->address =
            process->type == TransferType::kPush
                ? message.data_address.value_or(DataAddress{})
                : assetAddress(negotiation.value().asset_id);

        OUTCOME_TRY(process_lease, leases_.acquire(process->id, lease_wait_));
        auto started = startFlow(process);
        if (started) {
          process->processed_messages.insert(message.message_id);
          auto sent =
              sendOrAbort(process, startMessage(*process, started.value()));
          if (sent && save(*process)) {
            logger_->info("Transfer {} of agreement {} started for {}",
                          process->id,
                          process->agreement_id,
                          message.sender);
          }
        } else {
          handleFailure(process, message, started.error());
        }

        auto linked = store_.link(alias, process->id);
        if (!linked) {
          logger_->error("Transfer {} alias: {}",
                         process->id,
                         linked.error().message());
        }
        return outcome::success();
      }
    }
    // repeated request of a known consumer process restarts it
    return handleInbound(message, &TransferCoordinatorImpl::onTransferStart);
  }

  outcome::result<void> TransferCoordinatorImpl::onTransferStart(
      const ProcessPtr &process, const Message &message) {
    if (process->role == TransferRole::kProvider) {
      OUTCOME_TRY(edr, startFlow(process));
      return send(*process, startMessage(*process, edr));
    }

    if (process->counterparty_pid.empty()) {
      process->counterparty_pid = message.provider_pid;
    }
    auto context = std::make_shared<TransferContext>();
    if (process->type == TransferType::kPull) {
      if (!message.data_address || !message.token) {
        return TransferError::kMalformedMessage;
      }
      context->edr = Edr{
          process->id, *message.data_address, *message.token, "", {}};
    }
    if (process->state == TransferState::kRequested) {
      OUTCOME_TRY(transit(process, TransferEvent::kProvision, context));
    }
    OUTCOME_TRY(transit(process, TransferEvent::kStart, context));
    logger_->info("Transfer {} started by {}", process->id, message.sender);
    return outcome::success();
  }

  outcome::result<void> TransferCoordinatorImpl::onTransferSuspension(
      const ProcessPtr &process, const Message &) {
    return suspendLocked(process, false);
  }

  outcome::result<void> TransferCoordinatorImpl::onTransferCompletion(
      const ProcessPtr &process, const Message &) {
    return terminateLocked(process, TerminationReason::kCompleted, "", false);
  }

  outcome::result<void> TransferCoordinatorImpl::onTransferTermination(
      const ProcessPtr &process, const Message &message) {
    return terminateLocked(
        process,
        message.reason.value_or(TerminationReason::kCounterpartyAbort),
        message.detail.value_or(""),
        false);
  }
}  // namespace ds::transfer
