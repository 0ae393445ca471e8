/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "claims/claims_authority.hpp"
#include "common/logger.hpp"
#include "fsm/fsm.hpp"
#include "process/lease.hpp"
#include "process/process_store.hpp"
#include "signaling/data_plane.hpp"
#include "signaling/signaling_controller.hpp"

namespace ds::signaling {
  using claims::ClaimsAuthority;
  using claims::Token;
  using process::LeaseManager;
  using process::ProcessStore;
  using storage::PersistentBufferMap;

  class SignalingControllerImpl : public SignalingController {
   public:
    SignalingControllerImpl(std::shared_ptr<ClaimsAuthority> claims,
                            std::shared_ptr<DataPlane> data_plane,
                            std::shared_ptr<PersistentBufferMap> storage,
                            std::chrono::milliseconds lease_wait);

    outcome::result<boost::optional<Edr>> start(
        const ProcessId &process_id,
        TransferType type,
        const DataAddress &address) override;

    outcome::result<boost::optional<Edr>> resume(
        const ProcessId &process_id) override;

    outcome::result<void> suspend(const ProcessId &process_id) override;

    outcome::result<void> terminate(const ProcessId &process_id,
                                    TerminationReason reason) override;

    outcome::result<void> handleTrigger(const Trigger &trigger) override;

    outcome::result<DataFlow> getFlow(
        const ProcessId &process_id) const override;

   private:
    /** Data passed along with a flow event */
    struct FlowContext {
      TerminationReason reason{TerminationReason::kNone};
      /// token minted by the transition
      boost::optional<Token> token;
    };

    using DataFlowPtr = std::shared_ptr<DataFlow>;
    using FlowContextPtr = std::shared_ptr<FlowContext>;
    using SignalingTransition =
        fsm::Transition<DataFlowEvent, FlowContext, DataFlowState, DataFlow>;
    using SignalingFSM =
        fsm::FSM<DataFlowEvent, FlowContext, DataFlowState, DataFlow>;

    std::vector<SignalingTransition> makeFSMTransitions();

    /**
     * Applies event and persists the flow
     * @return kInvalidStateTransition if the event is not allowed in current
     * state, action or store error otherwise
     */
    outcome::result<void> apply(const DataFlowPtr &flow,
                                DataFlowEvent event,
                                const FlowContextPtr &context);

    /// Mints token and provisions data plane for new flow
    outcome::result<void> onProvision(const DataFlowPtr &flow,
                                      const FlowContextPtr &context);

    /// Mints token and resumes suspended flow
    outcome::result<void> onResume(const DataFlowPtr &flow,
                                   const FlowContextPtr &context);

    /// Pauses the flow, then revokes its token
    outcome::result<void> onSuspend(const DataFlowPtr &flow,
                                    const FlowContextPtr &context);

    /// Revokes token and tears down the flow
    outcome::result<void> onTerminate(const DataFlowPtr &flow,
                                      const FlowContextPtr &context);

    /// Revokes token minted by a failed transition
    void compensate(const DataFlow &flow, const FlowContext &context);

    /// Resumes data plane paused by a failed suspend with the current token
    void restore(const DataFlow &flow);

    boost::optional<Edr> makeEdr(const DataFlow &flow,
                                 const Token &token) const;

    std::shared_ptr<ClaimsAuthority> claims_;
    std::shared_ptr<DataPlane> data_plane_;
    ProcessStore<DataFlow> store_;
    LeaseManager leases_;
    std::chrono::milliseconds lease_wait_;
    std::unique_ptr<SignalingFSM> fsm_;

    common::Logger logger_;
  };
}  // namespace ds::signaling
