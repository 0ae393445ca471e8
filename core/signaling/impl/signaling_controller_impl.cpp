/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signaling/impl/signaling_controller_impl.hpp"

#include "fsm/error.hpp"
#include "signaling/signaling_error.hpp"

#define CALLBACK_ACTION(_action)                                      \
  [this](auto flow, auto event, auto context, auto from, auto to) {   \
    logger_->debug("Data flow {} " #_action, flow->id);               \
    return _action(flow, context);                                    \
  }

namespace ds::signaling {

  SignalingControllerImpl::SignalingControllerImpl(
      std::shared_ptr<ClaimsAuthority> claims,
      std::shared_ptr<DataPlane> data_plane,
      std::shared_ptr<PersistentBufferMap> storage,
      std::chrono::milliseconds lease_wait)
      : claims_{std::move(claims)},
        data_plane_{std::move(data_plane)},
        store_{std::move(storage), "dataflow"},
        lease_wait_{lease_wait},
        logger_{common::createLogger("signaling")} {
    fsm_ = std::make_unique<SignalingFSM>(makeFSMTransitions());
    fsm_->setAnyChangeAction([this](auto flow, auto, auto from, auto to) {
      logger_->debug("Data flow {} {} -> {}",
                     flow->id,
                     toString(from),
                     toString(to));
    });
  }

  outcome::result<boost::optional<Edr>> SignalingControllerImpl::start(
      const ProcessId &process_id,
      TransferType type,
      const DataAddress &address) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));

    auto flow = std::make_shared<DataFlow>();
    if (store_.contains(process_id)) {
      OUTCOME_TRYA(*flow, store_.load(process_id));
      if (flow->state == DataFlowState::kTerminated) {
        logger_->warn("Start of terminated data flow {}", process_id);
        return SignalingError::kInvalidStateTransition;
      }
      if (flow->type != type || flow->address != address) {
        logger_->warn("Start of data flow {} in state {} with other parameters",
                      process_id,
                      toString(flow->state));
        return SignalingError::kParametersMismatch;
      }
      if (flow->state == DataFlowState::kStarted) {
        if (flow->type == TransferType::kPush) {
          return boost::none;
        }
        OUTCOME_TRY(token, claims_->findToken(flow->token_id));
        return makeEdr(*flow, token);
      }
    } else {
      flow->id = process_id;
      flow->type = type;
      flow->address = address;
    }

    auto context = std::make_shared<FlowContext>();
    OUTCOME_TRY(apply(flow, DataFlowEvent::kStart, context));
    return makeEdr(*flow, context->token.value());
  }

  outcome::result<boost::optional<Edr>> SignalingControllerImpl::resume(
      const ProcessId &process_id) {
    OUTCOME_TRY(flow, getFlow(process_id));
    return start(process_id, flow.type, flow.address);
  }

  outcome::result<void> SignalingControllerImpl::suspend(
      const ProcessId &process_id) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    if (!store_.contains(process_id)) {
      logger_->warn("Suspend of unknown data flow {}", process_id);
      return SignalingError::kInvalidStateTransition;
    }
    OUTCOME_TRY(loaded, store_.load(process_id));
    auto flow = std::make_shared<DataFlow>(std::move(loaded));
    return apply(flow, DataFlowEvent::kSuspend, std::make_shared<FlowContext>());
  }

  outcome::result<void> SignalingControllerImpl::terminate(
      const ProcessId &process_id, TerminationReason reason) {
    OUTCOME_TRY(lease, leases_.acquire(process_id, lease_wait_));
    if (!store_.contains(process_id)) {
      logger_->warn("Terminate of unknown data flow {}", process_id);
      return SignalingError::kInvalidStateTransition;
    }
    OUTCOME_TRY(loaded, store_.load(process_id));
    if (loaded.state == DataFlowState::kTerminated) {
      return outcome::success();
    }
    auto flow = std::make_shared<DataFlow>(std::move(loaded));
    auto context = std::make_shared<FlowContext>();
    context->reason = reason;
    return apply(flow, DataFlowEvent::kTerminate, context);
  }

  outcome::result<void> SignalingControllerImpl::handleTrigger(
      const Trigger &trigger) {
    auto decision = decide(trigger);
    if (decision.suspend) {
      return suspend(decision.process_id);
    }
    return terminate(decision.process_id, decision.reason);
  }

  outcome::result<DataFlow> SignalingControllerImpl::getFlow(
      const ProcessId &process_id) const {
    return store_.load(process_id);
  }

  std::vector<SignalingControllerImpl::SignalingTransition>
  SignalingControllerImpl::makeFSMTransitions() {
    return {SignalingTransition(DataFlowEvent::kStart)
                .from(DataFlowState::kRequested)
                .to(DataFlowState::kStarted)
                .action(CALLBACK_ACTION(onProvision)),
            SignalingTransition(DataFlowEvent::kStart)
                .from(DataFlowState::kSuspended)
                .to(DataFlowState::kStarted)
                .action(CALLBACK_ACTION(onResume)),
            SignalingTransition(DataFlowEvent::kSuspend)
                .from(DataFlowState::kStarted)
                .to(DataFlowState::kSuspended)
                .action(CALLBACK_ACTION(onSuspend)),
            SignalingTransition(DataFlowEvent::kTerminate)
                .fromMany(DataFlowState::kRequested,
                          DataFlowState::kStarted,
                          DataFlowState::kSuspended)
                .to(DataFlowState::kTerminated)
                .action(CALLBACK_ACTION(onTerminate))};
  }

  outcome::result<void> SignalingControllerImpl::apply(
      const DataFlowPtr &flow,
      DataFlowEvent event,
      const FlowContextPtr &context) {
    const auto state = flow->state;
    auto applied = fsm_->dispatch(flow, event, context);
    if (!applied) {
      if (applied.error() == fsm::FsmError::kInvalidTransition) {
        logger_->warn("Data flow {} rejected event in state {}",
                      flow->id,
                      toString(state));
        return SignalingError::kInvalidStateTransition;
      }
      logger_->error("Data flow {} in state {} failed: {}",
                     flow->id,
                     toString(state),
                     applied.error().message());
      return applied.error();
    }
    auto saved = store_.save(*flow);
    if (!saved) {
      logger_->error("Data flow {} not saved: {}",
                     flow->id,
                     saved.error().message());
      compensate(*flow, *context);
      return saved.error();
    }
    return outcome::success();
  }

  outcome::result<void> SignalingControllerImpl::onProvision(
      const DataFlowPtr &flow, const FlowContextPtr &context) {
    OUTCOME_TRY(token, claims_->issueToken(flow->id, flow->type));
    context->token = token;
    auto endpoint =
        data_plane_->provision(flow->id, flow->type, flow->address, token.value);
    if (!endpoint) {
      compensate(*flow, *context);
      return endpoint.error();
    }
    flow->endpoint = endpoint.value();
    flow->token_id = token.id;
    return outcome::success();
  }

  outcome::result<void> SignalingControllerImpl::onResume(
      const DataFlowPtr &flow, const FlowContextPtr &context) {
    OUTCOME_TRY(token, claims_->issueToken(flow->id, flow->type));
    context->token = token;
    auto resumed = data_plane_->resume(flow->id, token.value);
    if (!resumed) {
      compensate(*flow, *context);
      return resumed.error();
    }
    flow->token_id = token.id;
    return outcome::success();
  }

  outcome::result<void> SignalingControllerImpl::onSuspend(
      const DataFlowPtr &flow, const FlowContextPtr &) {
    OUTCOME_TRY(data_plane_->pause(flow->id));
    auto revoked = claims_->revokeToken(flow->token_id);
    if (!revoked) {
      // flow stays started, its live token has to be served again
      restore(*flow);
      return revoked.error();
    }
    flow->token_id.clear();
    return outcome::success();
  }

  void SignalingControllerImpl::restore(const DataFlow &flow) {
    auto resumed = [&]() -> outcome::result<void> {
      OUTCOME_TRY(token, claims_->findToken(flow.token_id));
      return data_plane_->resume(flow.id, token.value);
    }();
    if (!resumed) {
      logger_->error("Data flow {} left paused in state {}: {}",
                     flow.id,
                     toString(flow.state),
                     resumed.error().message());
    }
  }

  outcome::result<void> SignalingControllerImpl::onTerminate(
      const DataFlowPtr &flow, const FlowContextPtr &context) {
    if (!flow->token_id.empty()) {
      OUTCOME_TRY(claims_->revokeToken(flow->token_id));
    }
    if (flow->state != DataFlowState::kRequested) {
      OUTCOME_TRY(data_plane_->teardown(flow->id));
    }
    flow->token_id.clear();
    flow->termination_reason = context->reason;
    return outcome::success();
  }

  void SignalingControllerImpl::compensate(const DataFlow &flow,
                                           const FlowContext &context) {
    if (!context.token) {
      return;
    }
    auto revoked = claims_->revokeToken(context.token->id);
    if (!revoked) {
      logger_->error("Token {} of data flow {} left live: {}",
                     context.token->id,
                     flow.id,
                     revoked.error().message());
    }
  }

  boost::optional<Edr> SignalingControllerImpl::makeEdr(
      const DataFlow &flow, const Token &token) const {
    if (flow.type != TransferType::kPull) {
      return boost::none;
    }
    return Edr{flow.id, flow.endpoint, token.value, token.id, token.expiry};
  }
}  // namespace ds::signaling
