/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "negotiation/impl/negotiation_engine_impl.hpp"

#include <set>

#include "claims/claims_error.hpp"
#include "common/uuid.hpp"
#include "fsm/error.hpp"
#include "negotiation/negotiation_error.hpp"
#include "process/process_store_error.hpp"
#include "protocol/protocol_error.hpp"

#define CALLBACK_ACTION(_action)                                         \
  [this](auto process, auto event, auto context, auto from, auto to) {   \
    logger_->debug("Negotiation {} " #_action, process->id);             \
    return _action(process, context);                                    \
  }

namespace ds::negotiation {
  using claims::Presentation;
  using claims::VerifiedClaims;
  using process::ProcessStoreError;
  using protocol::NegotiationEventType;
  using protocol::ProtocolError;

  namespace {
    constexpr auto kSignerClaim{"signer"};

    std::string requestAlias(const ParticipantId &consumer,
                             const ProcessId &consumer_pid) {
      return "request/" + consumer + "/" + consumer_pid;
    }

    std::string agreementAlias(const std::string &agreement_id) {
      return "agreement/" + agreement_id;
    }
  }  // namespace

  NegotiationEngineImpl::NegotiationEngineImpl(
      std::shared_ptr<Identity> identity,
      NegotiationConfig config,
      std::chrono::milliseconds lease_wait,
      std::shared_ptr<ClaimsAuthority> claims,
      std::shared_ptr<PolicyEngine> policy,
      std::shared_ptr<RetryingSender> sender,
      std::shared_ptr<PersistentBufferMap> storage,
      std::shared_ptr<UTCClock> clock)
      : identity_{std::move(identity)},
        config_{config},
        lease_wait_{lease_wait},
        claims_{std::move(claims)},
        policy_{std::move(policy)},
        sender_{std::move(sender)},
        store_{std::move(storage), "negotiation"},
        clock_{std::move(clock)},
        logger_{common::createLogger("negotiation")} {
    fsm_ = std::make_unique<NegotiationFSM>(makeFSMTransitions());
    fsm_->setAnyChangeAction([this](auto process, auto, auto from, auto to) {
      logger_->debug("Negotiation {} {} -> {}",
                     process->id,
                     toString(from),
                     toString(to));
    });
  }

  void NegotiationEngineImpl::subscribe(
      protocol::MessageDispatcher &dispatcher) {
    std::weak_ptr<NegotiationEngineImpl> weak{shared_from_this()};
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
        MessageType::kContractRequest,
        [weak](const Message &message) -> outcome::result<void> {
          if (auto self = weak.lock()) {
            return self->onContractRequest(message);
          }
          return outcome::success();
        });
    dispatcher.subscribe(MessageType::kContractOffer,
                         bind(&NegotiationEngineImpl::onContractOffer));
    dispatcher.subscribe(MessageType::kContractAgreement,
                         bind(&NegotiationEngineImpl::onContractAgreement));
    dispatcher.subscribe(
        MessageType::kContractAgreementVerification,
        bind(&NegotiationEngineImpl::onAgreementVerification));
    dispatcher.subscribe(MessageType::kContractNegotiationEvent,
                         bind(&NegotiationEngineImpl::onNegotiationEvent));
    dispatcher.subscribe(MessageType::kContractNegotiationTermination,
                         bind(&NegotiationEngineImpl::onTermination));
  }

  outcome::result<ProcessId> NegotiationEngineImpl::requestContract(
      const ParticipantId &provider, const ContractOffer &offer) {
    auto process = std::make_shared<NegotiationProcess>();
    process->id = common::generateUuid();
    process->role = NegotiationRole::kConsumer;
    process->counterparty_id = provider;
    process->asset_id = offer.asset_id;
    process->offers.push_back(ownOffer(offer));

    OUTCOME_TRY(lease, leases_.acquire(process->id, lease_wait_));
    auto message = makeMessage(*process, MessageType::kContractRequest);
    message.offer = process->offers.back();
    OUTCOME_TRY(send(*process, std::move(message)));
    OUTCOME_TRY(save(*process));
    logger_->info("Negotiation {} of {} requested from {}",
                  process->id,
                  process->asset_id,
                  provider);
    return process->id;
  }

  outcome::result<void> NegotiationEngineImpl::acceptOffer(
      const ProcessId &process_id) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    if (process->role != NegotiationRole::kConsumer) {
      return NegotiationError::kWrongRole;
    }
    if (process->offers.empty()
        || process->offers.back().offered_by != process->counterparty_id) {
      return NegotiationError::kInvalidStateTransition;
    }

    ContractAgreement agreement;
    agreement.agreement_id = common::generateUuid();
    agreement.offer = process->offers.back();
    agreement.consumer_id = identity_->id();
    agreement.provider_id = process->counterparty_id;
    OUTCOME_TRYA(agreement.consumer_signature, signAgreement(agreement));

    auto context = std::make_shared<NegotiationContext>();
    context->agreement = agreement;
    OUTCOME_TRY(transit(process, NegotiationEvent::kAccept, context));

    auto message =
        makeMessage(*process, MessageType::kContractNegotiationEvent);
    message.event = NegotiationEventType::kAccepted;
    message.agreement = agreement;
    OUTCOME_TRY(sendOrAbort(process, std::move(message)));
    return save(*process);
  }

  outcome::result<void> NegotiationEngineImpl::counterOffer(
      const ProcessId &process_id, const ContractOffer &offer) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    if (process->counterparty_pid.empty()) {
      return NegotiationError::kInvalidStateTransition;
    }

    auto context = std::make_shared<NegotiationContext>();
    context->offer = ownOffer(offer);
    auto offered = transit(process, NegotiationEvent::kOffer, context);
    if (!offered) {
      if (offered.error() == NegotiationError::kOfferLimitExceeded) {
        OUTCOME_TRY(abort(process,
                          TerminationReason::kOfferLimitExceeded,
                          offered.error().message(),
                          true));
      }
      return offered.error();
    }

    auto message = makeMessage(*process,
                               process->role == NegotiationRole::kConsumer
                                   ? MessageType::kContractRequest
                                   : MessageType::kContractOffer);
    message.offer = context->offer;
    OUTCOME_TRY(sendOrAbort(process, std::move(message)));
    return save(*process);
  }

  outcome::result<void> NegotiationEngineImpl::decline(
      const ProcessId &process_id) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    OUTCOME_TRY(transit(process, NegotiationEvent::kDecline));
    auto message =
        makeMessage(*process, MessageType::kContractNegotiationEvent);
    message.event = NegotiationEventType::kDeclined;
    OUTCOME_TRY(sendOrAbort(process, std::move(message)));
    return save(*process);
  }

  outcome::result<void> NegotiationEngineImpl::agree(
      const ProcessId &process_id) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    if (process->role != NegotiationRole::kProvider) {
      return NegotiationError::kWrongRole;
    }
    auto agreed = agreeLocked(process);
    if (!agreed) {
      if (agreed.error() == ProtocolError::kCounterpartyUnreachable) {
        OUTCOME_TRY(abort(process,
                          TerminationReason::kCounterpartyUnreachable,
                          agreed.error().message(),
                          false));
      }
      return agreed.error();
    }
    return save(*process);
  }

  outcome::result<void> NegotiationEngineImpl::terminate(
      const ProcessId &process_id, TerminationReason reason) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    OUTCOME_TRY(process, load(process_id));
    if (process->state == NegotiationState::kTerminated) {
      return outcome::success();
    }
    return abort(process, reason, "", true);
  }

  outcome::result<NegotiationProcess> NegotiationEngineImpl::getProcess(
      const ProcessId &process_id) const {
    return store_.load(process_id);
  }

  outcome::result<NegotiationProcess> NegotiationEngineImpl::findByAgreement(
      const std::string &agreement_id) const {
    OUTCOME_TRY(process_id, store_.resolve(agreementAlias(agreement_id)));
    return store_.load(process_id);
  }

  outcome::result<std::vector<NegotiationProcess>>
  NegotiationEngineImpl::listByState(NegotiationState state) const {
    return store_.listByState(state);
  }

  outcome::result<size_t> NegotiationEngineImpl::terminateStale() {
    OUTCOME_TRY(processes, store_.list());
    const auto now = clock_->nowUTC();
    size_t terminated = 0;
    for (const auto &process : processes) {
      if (isTerminal(process.state)
          || now - process.updated_at < config_.timeout) {
        continue;
      }
      auto result = terminate(process.id, TerminationReason::kTimeout);
      if (!result) {
        logger_->warn("Stale negotiation {} in state {} not terminated: {}",
                      process.id,
                      toString(process.state),
                      result.error().message());
        continue;
      }
      ++terminated;
    }
    return terminated;
  }

  std::vector<NegotiationEngineImpl::NegotiationTransition>
  NegotiationEngineImpl::makeFSMTransitions() {
    return {NegotiationTransition(NegotiationEvent::kOffer)
                .fromMany(NegotiationState::kRequested,
                          NegotiationState::kOffered,
                          NegotiationState::kDeclined)
                .to(NegotiationState::kOffered)
                .action(CALLBACK_ACTION(onOffer)),
            NegotiationTransition(NegotiationEvent::kAccept)
                .from(NegotiationState::kOffered)
                .to(NegotiationState::kAccepted)
                .action(CALLBACK_ACTION(onAccept)),
            NegotiationTransition(NegotiationEvent::kDecline)
                .from(NegotiationState::kOffered)
                .to(NegotiationState::kDeclined),
            NegotiationTransition(NegotiationEvent::kAgree)
                .from(NegotiationState::kAccepted)
                .to(NegotiationState::kAgreed)
                .action(CALLBACK_ACTION(onAgree)),
            NegotiationTransition(NegotiationEvent::kVerify)
                .from(NegotiationState::kAgreed)
                .to(NegotiationState::kVerified),
            NegotiationTransition(NegotiationEvent::kFinalize)
                .from(NegotiationState::kVerified)
                .to(NegotiationState::kFinalized),
            NegotiationTransition(NegotiationEvent::kTerminate)
                .fromMany(NegotiationState::kRequested,
                          NegotiationState::kOffered,
                          NegotiationState::kAccepted,
                          NegotiationState::kDeclined,
                          NegotiationState::kAgreed,
                          NegotiationState::kVerified)
                .to(NegotiationState::kTerminated)
                .action(CALLBACK_ACTION(onTerminate))};
  }

  outcome::result<void> NegotiationEngineImpl::onOffer(
      const ProcessPtr &process, const ContextPtr &context) {
    if (!context || !context->offer) {
      return NegotiationError::kMalformedMessage;
    }
    if (process->offers.size() >= config_.max_offers) {
      logger_->warn("Negotiation {} reached {} offers",
                    process->id,
                    process->offers.size());
      return NegotiationError::kOfferLimitExceeded;
    }
    process->offers.push_back(*context->offer);
    return outcome::success();
  }

  outcome::result<void> NegotiationEngineImpl::onAccept(
      const ProcessPtr &process, const ContextPtr &context) {
    if (!context || !context->agreement) {
      return NegotiationError::kMalformedMessage;
    }
    process->agreement = context->agreement;
    return outcome::success();
  }

  outcome::result<void> NegotiationEngineImpl::onAgree(
      const ProcessPtr &process, const ContextPtr &context) {
    if (!context || !context->agreement) {
      return NegotiationError::kMalformedMessage;
    }
    if (!context->agreement->isSigned()) {
      return NegotiationError::kAgreementNotSigned;
    }
    process->agreement = context->agreement;
    return outcome::success();
  }

  outcome::result<void> NegotiationEngineImpl::onTerminate(
      const ProcessPtr &process, const ContextPtr &context) {
    if (context) {
      process->termination_reason = context->reason;
      process->message = context->detail;
    }
    return outcome::success();
  }

  outcome::result<void> NegotiationEngineImpl::transit(
      const ProcessPtr &process,
      NegotiationEvent event,
      ContextPtr context) {
    auto applied = fsm_->dispatch(process, event, std::move(context));
    if (!applied) {
      if (applied.error() == fsm::FsmError::kInvalidTransition) {
        logger_->warn("Negotiation {} rejected event in state {}",
                      process->id,
                      toString(process->state));
        return NegotiationError::kInvalidStateTransition;
      }
      return applied.error();
    }
    return outcome::success();
  }

  outcome::result<NegotiationEngineImpl::ProcessPtr>
  NegotiationEngineImpl::load(const ProcessId &process_id) const {
    OUTCOME_TRY(process, store_.load(process_id));
    return std::make_shared<NegotiationProcess>(std::move(process));
  }

  outcome::result<void> NegotiationEngineImpl::save(
      NegotiationProcess &process) {
    process.updated_at = clock_->nowUTC();
    auto saved = store_.save(process);
    if (!saved) {
      logger_->error("Negotiation {} in state {} not saved: {}",
                     process.id,
                     toString(process.state),
                     saved.error().message());
    }
    return saved;
  }

  Message NegotiationEngineImpl::makeMessage(const NegotiationProcess &process,
                                             MessageType type) const {
    Message message;
    message.type = type;
    if (process.role == NegotiationRole::kConsumer) {
      message.consumer_pid = process.id;
      message.provider_pid = process.counterparty_pid;
    } else {
      message.consumer_pid = process.counterparty_pid;
      message.provider_pid = process.id;
    }
    return message;
  }

  outcome::result<void> NegotiationEngineImpl::send(
      const NegotiationProcess &process, Message message) {
    std::weak_ptr<NegotiationEngineImpl> weak{shared_from_this()};
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

  outcome::result<void> NegotiationEngineImpl::sendOrAbort(
      const ProcessPtr &process, Message message) {
    auto sent = send(*process, std::move(message));
    if (!sent && sent.error() == ProtocolError::kCounterpartyUnreachable) {
      auto aborted = abort(process,
                           TerminationReason::kCounterpartyUnreachable,
                           sent.error().message(),
                           false);
      if (!aborted) {
        logger_->error("Negotiation {} not terminated: {}",
                       process->id,
                       aborted.error().message());
      }
    }
    return sent;
  }

  outcome::result<void> NegotiationEngineImpl::abort(
      const ProcessPtr &process,
      TerminationReason reason,
      const std::string &detail,
      bool notify) {
    sender_->cancel(process->id);
    auto context = std::make_shared<NegotiationContext>();
    context->reason = reason;
    context->detail = detail;
    OUTCOME_TRY(transit(process, NegotiationEvent::kTerminate, context));
    logger_->info("Negotiation {} terminated: {}",
                  process->id,
                  primitives::toString(reason));

    if (notify && !process->counterparty_id.empty()) {
      auto message =
          makeMessage(*process, MessageType::kContractNegotiationTermination);
      message.reason = reason;
      if (!detail.empty()) {
        message.detail = detail;
      }
      auto sent = send(*process, std::move(message));
      if (!sent) {
        logger_->warn("Termination of negotiation {} not sent to {}: {}",
                      process->id,
                      process->counterparty_id,
                      sent.error().message());
      }
    }
    return save(*process);
  }

  void NegotiationEngineImpl::onExhausted(const ProcessId &process_id) {
    auto lease = leases_.acquire(process_id, lease_wait_);
    if (!lease) {
      logger_->error("Negotiation {} lease: {}",
                     process_id,
                     lease.error().message());
      return;
    }
    auto process = load(process_id);
    if (!process) {
      logger_->error("Negotiation {} load: {}",
                     process_id,
                     process.error().message());
      return;
    }
    if (isTerminal(process.value()->state)) {
      return;
    }
    auto aborted = abort(process.value(),
                         TerminationReason::kCounterpartyUnreachable,
                         "retries exhausted",
                         false);
    if (!aborted) {
      logger_->error("Negotiation {} not terminated: {}",
                     process_id,
                     aborted.error().message());
    }
  }

  ContractOffer NegotiationEngineImpl::ownOffer(ContractOffer offer) const {
    if (offer.offer_id.empty()) {
      offer.offer_id = common::generateUuid();
    }
    offer.offered_by = identity_->id();
    return offer;
  }

  outcome::result<std::string> NegotiationEngineImpl::signAgreement(
      const ContractAgreement &agreement) {
    auto terms = primitives::agreementTerms(agreement);
    terms[kSignerClaim] = identity_->id();
    return claims_->sign(agreement.agreement_id, terms);
  }

  outcome::result<void> NegotiationEngineImpl::verifySignature(
      const ContractAgreement &agreement,
      const std::string &signature,
      const ParticipantId &signer) const {
    if (signature.empty()) {
      return NegotiationError::kAgreementNotSigned;
    }
    OUTCOME_TRY(verified,
                claims_->verifyPresentation(Presentation{"", signature}));
    auto terms = primitives::agreementTerms(agreement);
    terms[kSignerClaim] = signer;
    if (verified.subject != agreement.agreement_id || verified.claims != terms) {
      return NegotiationError::kAgreementMismatch;
    }
    return outcome::success();
  }

  outcome::result<VerifiedClaims> NegotiationEngineImpl::verifySender(
      const Message &message) const {
    return claims_->verifyPresentation(
        Presentation{message.sender, message.presentation});
  }

  outcome::result<void> NegotiationEngineImpl::offerTo(
      const ProcessPtr &process,
      const VerifiedClaims &requester,
      const ContractOffer &requested) {
    OUTCOME_TRY(decision, policy_->evaluate(requester, requested.asset_id));
    if (decision == PolicyDecision::kDeny) {
      logger_->warn("Policy denied {} to {} in negotiation {}",
                    requested.asset_id,
                    process->counterparty_id,
                    process->id);
      return NegotiationError::kPolicyDenied;
    }
    auto offer = requested;
    offer.offer_id.clear();
    auto context = std::make_shared<NegotiationContext>();
    context->offer = ownOffer(offer);
    OUTCOME_TRY(transit(process, NegotiationEvent::kOffer, context));

    auto message = makeMessage(*process, MessageType::kContractOffer);
    message.offer = context->offer;
    return send(*process, std::move(message));
  }

  outcome::result<void> NegotiationEngineImpl::agreeLocked(
      const ProcessPtr &process) {
    if (!process->agreement) {
      return NegotiationError::kInvalidStateTransition;
    }
    auto agreement = *process->agreement;
    OUTCOME_TRYA(agreement.provider_signature, signAgreement(agreement));
    auto context = std::make_shared<NegotiationContext>();
    context->agreement = agreement;
    OUTCOME_TRY(transit(process, NegotiationEvent::kAgree, context));

    auto message = makeMessage(*process, MessageType::kContractAgreement);
    message.agreement = agreement;
    return send(*process, std::move(message));
  }

  outcome::result<ProcessId> NegotiationEngineImpl::locate(
      const Message &message) const {
    auto addressed = [&](const ProcessId &process_id, NegotiationRole role) {
      if (process_id.empty()) {
        return false;
      }
      auto process = store_.load(process_id);
      return process && process.value().role == role
             && process.value().counterparty_id == message.sender;
    };
    if (addressed(message.provider_pid, NegotiationRole::kProvider)) {
      return message.provider_pid;
    }
    if (addressed(message.consumer_pid, NegotiationRole::kConsumer)) {
      return message.consumer_pid;
    }
    auto requested =
        store_.resolve(requestAlias(message.sender, message.consumer_pid));
    if (requested && addressed(requested.value(), NegotiationRole::kProvider)) {
      return requested.value();
    }
    return ProcessStoreError::kNotFound;
  }

  outcome::result<std::vector<process::Lease>>
  NegotiationEngineImpl::leaseAddressed(const Message &message) {
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

  outcome::result<void> NegotiationEngineImpl::handleInbound(
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
      logger_->warn("{} {} from {} for unknown negotiation",
                    toString(message.type),
                    message.message_id,
                    message.sender);
      return outcome::success();
    }
    auto loaded = load(process_id.value());
    if (!loaded) {
      logger_->error("Negotiation {} load: {}",
                     process_id.value(),
                     loaded.error().message());
      return loaded.error();
    }
    auto process = loaded.value();
    if (process->processed_messages.count(message.message_id) != 0) {
      logger_->debug("Duplicate {} {} for negotiation {}",
                     toString(message.type),
                     message.message_id,
                     process->id);
      return outcome::success();
    }
    if (isTerminal(process->state)) {
      logger_->warn("{} {} for negotiation {} in state {} ignored",
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
    logger_->debug("{} {} applied to negotiation {}",
                   toString(message.type),
                   message.message_id,
                   process->id);
    return outcome::success();
  }

  void NegotiationEngineImpl::handleFailure(const ProcessPtr &process,
                                            const Message &message,
                                            const std::error_code &error) {
    boost::optional<TerminationReason> reason;
    bool notify = true;
    if (error == NegotiationError::kPolicyDenied) {
      reason = TerminationReason::kPolicyDenied;
    } else if (error == NegotiationError::kOfferLimitExceeded) {
      reason = TerminationReason::kOfferLimitExceeded;
    } else if (claims::isVerificationFailure(error)
               || error == NegotiationError::kAgreementMismatch
               || error == NegotiationError::kAgreementNotSigned) {
      reason = TerminationReason::kVerificationFailed;
    } else if (error == ProtocolError::kCounterpartyUnreachable) {
      reason = TerminationReason::kCounterpartyUnreachable;
      notify = false;
    }

    if (!reason) {
      logger_->warn("{} {} for negotiation {} in state {} failed: {}",
                    toString(message.type),
                    message.message_id,
                    process->id,
                    toString(process->state),
                    error.message());
      return;
    }
    logger_->error("{} {} for negotiation {} in state {} failed: {}",
                   toString(message.type),
                   message.message_id,
                   process->id,
                   toString(process->state),
                   error.message());
    process->processed_messages.insert(message.message_id);
    auto aborted = abort(process, *reason, error.message(), notify);
    if (!aborted) {
      logger_->error("Negotiation {} not terminated: {}",
                     process->id,
                     aborted.error().message());
    }
  }

  outcome::result<void> NegotiationEngineImpl::onContractRequest(
      const Message &message) {
    if (!message.provider_pid.empty()) {
      return handleInbound(message, &NegotiationEngineImpl::onCounterRequest);
    }
    if (!message.offer) {
      logger_->warn("ContractRequest {} from {} without offer",
                    message.message_id,
                    message.sender);
      return outcome::success();
    }
    const auto alias = requestAlias(message.sender, message.consumer_pid);
    auto lease = leases_.acquire(alias, lease_wait_);
    if (!lease) {
      logger_->warn("ContractRequest {} not acknowledged: {}",
                    message.message_id,
                    lease.error().message());
      return lease.error();
    }
    if (store_.resolve(alias)) {
      logger_->debug("Duplicate ContractRequest {} from {}",
                     message.message_id,
                     message.sender);
      return outcome::success();
    }

    auto process = std::make_shared<NegotiationProcess>();
    process->id = common::generateUuid();
    process->role = NegotiationRole::kProvider;
    process->counterparty_id = message.sender;
    process->counterparty_pid = message.consumer_pid;
    process->asset_id = message.offer->asset_id;
    process->offers.push_back(*message.offer);
    OUTCOME_TRY(process_lease, leases_.acquire(process->id, lease_wait_));
    logger_->info("Negotiation {} of {} requested by {}",
                  process->id,
                  process->asset_id,
                  message.sender);

    auto offered = [&]() -> outcome::result<void> {
      OUTCOME_TRY(requester, verifySender(message));
      return offerTo(process, requester, *message.offer);
    }();
    if (offered) {
      process->processed_messages.insert(message.message_id);
      OUTCOME_TRY(save(*process));
    } else {
      handleFailure(process, message, offered.error());
    }

    auto linked = store_.link(alias, process->id);
    if (!linked) {
      logger_->error("Negotiation {} alias: {}",
                     process->id,
                     linked.error().message());
    }
    return outcome::success();
  }

  outcome::result<void> NegotiationEngineImpl::onCounterRequest(
      const ProcessPtr &process, const Message &message) {
    if (!message.offer || message.offer->offered_by != message.sender) {
      return NegotiationError::kMalformedMessage;
    }
    auto context = std::make_shared<NegotiationContext>();
    context->offer = message.offer;
    OUTCOME_TRY(transit(process, NegotiationEvent::kOffer, context));
    OUTCOME_TRY(requester, verifySender(message));
    return offerTo(process, requester, *message.offer);
  }

  outcome::result<void> NegotiationEngineImpl::onContractOffer(
      const ProcessPtr &process, const Message &message) {
    if (!message.offer || message.offer->offered_by != message.sender) {
      return NegotiationError::kMalformedMessage;
    }
    if (process->counterparty_pid.empty()) {
      process->counterparty_pid = message.provider_pid;
    }
    auto context = std::make_shared<NegotiationContext>();
    context->offer = message.offer;
    return transit(process, NegotiationEvent::kOffer, context);
  }

  outcome::result<void> NegotiationEngineImpl::onContractAgreement(
      const ProcessPtr &process, const Message &message) {
    if (!message.agreement) {
      return NegotiationError::kMalformedMessage;
    }
    if (process->role != NegotiationRole::kConsumer) {
      return NegotiationError::kWrongRole;
    }
    const auto &agreement = *message.agreement;
    if (!process->agreement
        || process->agreement->agreement_id != agreement.agreement_id
        || primitives::agreementTerms(*process->agreement)
               != primitives::agreementTerms(agreement)
        || process->agreement->consumer_signature
               != agreement.consumer_signature) {
      return NegotiationError::kAgreementMismatch;
    }
    OUTCOME_TRY(verifySignature(
        agreement, agreement.provider_signature, agreement.provider_id));

    auto context = std::make_shared<NegotiationContext>();
    context->agreement = agreement;
    OUTCOME_TRY(transit(process, NegotiationEvent::kAgree, context));
    OUTCOME_TRY(transit(process, NegotiationEvent::kVerify));
    OUTCOME_TRY(store_.link(agreementAlias(agreement.agreement_id), process->id));

    return send(*process,
                makeMessage(*process,
                            MessageType::kContractAgreementVerification));
  }

  outcome::result<void> NegotiationEngineImpl::onAgreementVerification(
      const ProcessPtr &process, const Message &message) {
    if (process->role != NegotiationRole::kProvider || !process->agreement) {
      return NegotiationError::kWrongRole;
    }
    OUTCOME_TRY(transit(process, NegotiationEvent::kVerify));
    OUTCOME_TRY(transit(process, NegotiationEvent::kFinalize));
    OUTCOME_TRY(store_.link(agreementAlias(process->agreement->agreement_id),
                            process->id));

    auto event = makeMessage(*process, MessageType::kContractNegotiationEvent);
    event.event = NegotiationEventType::kFinalized;
    OUTCOME_TRY(send(*process, std::move(event)));
    logger_->info("Negotiation {} finalized agreement {}",
                  process->id,
                  process->agreement->agreement_id);
    return outcome::success();
  }

  outcome::result<void> NegotiationEngineImpl::onNegotiationEvent(
      const ProcessPtr &process, const Message &message) {
    if (!message.event) {
      return NegotiationError::kMalformedMessage;
    }
    switch (*message.event) {
      case NegotiationEventType::kAccepted: {
        if (process->role != NegotiationRole::kProvider) {
          return NegotiationError::kWrongRole;
        }
        if (!message.agreement) {
          return NegotiationError::kMalformedMessage;
        }
        const auto &agreement = *message.agreement;
        if (process->offers.empty()
            || !(agreement.offer == process->offers.back())
            || agreement.consumer_id != process->counterparty_id
            || agreement.provider_id != identity_->id()) {
          return NegotiationError::kAgreementMismatch;
        }
        OUTCOME_TRY(verifySignature(
            agreement, agreement.consumer_signature, agreement.consumer_id));
        auto context = std::make_shared<NegotiationContext>();
        context->agreement = agreement;
        OUTCOME_TRY(transit(process, NegotiationEvent::kAccept, context));
        if (config_.auto_agree) {
          return agreeLocked(process);
        }
        return outcome::success();
      }
      case NegotiationEventType::kDeclined:
        return transit(process, NegotiationEvent::kDecline);
      case NegotiationEventType::kFinalized:
        if (process->role != NegotiationRole::kConsumer) {
          return NegotiationError::kWrongRole;
        }
        OUTCOME_TRY(transit(process, NegotiationEvent::kFinalize));
        logger_->info("Negotiation {} finalized agreement {}",
                      process->id,
                      process->agreement->agreement_id);
        return outcome::success();
    }
    return NegotiationError::kMalformedMessage;
  }

  outcome::result<void> NegotiationEngineImpl::onTermination(
      const ProcessPtr &process, const Message &message) {
    sender_->cancel(process->id);
    auto context = std::make_shared<NegotiationContext>();
    context->reason =
        message.reason.value_or(TerminationReason::kCounterpartyAbort);
    context->detail = message.detail.value_or("");
    OUTCOME_TRY(transit(process, NegotiationEvent::kTerminate, context));
    logger_->info("Negotiation {} terminated by {}: {}",
                  process->id,
                  message.sender,
                  primitives::toString(context->reason));
    return outcome::success();
  }
}  // namespace ds::negotiation
