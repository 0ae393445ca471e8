/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_coordinator.hpp"

#include <gtest/gtest.h>

#include "claims/claims_authority.hpp"
#include "claims/claims_error.hpp"
#include "testutil/dataspace/participants_fixture.hpp"
#include "testutil/outcome.hpp"
#include "transfer/transfer_error.hpp"

namespace ds::node {
  using claims::ClaimsError;
  using primitives::ProcessId;
  using primitives::TerminationReason;
  using transfer::TransferError;
  using transfer::TransferProcess;
  using transfer::TransferRole;
  using transfer::TransferState;

  class TransferCoordinatorTest : public ParticipantsFixture {
   public:
    void SetUp() override {
      ParticipantsFixture::SetUp();
      agreement_id = finalize("asset-1");
      ASSERT_FALSE(agreement_id.empty());
    }

    TransferProcess process(const ParticipantObjects &participant,
                            const ProcessId &process_id) {
      auto process = participant.transfer->getProcess(process_id);
      EXPECT_TRUE(process) << process.error().message();
      return process ? process.value() : TransferProcess{};
    }

    /// The only provider transfer in the state
    TransferProcess providerProcess(TransferState state) {
      auto processes = provider.transfer->listByState(state);
      if (!processes || processes.value().size() != 1) {
        ADD_FAILURE() << "expected one provider transfer in state "
                      << transfer::toString(state);
        return {};
      }
      return processes.value().front();
    }

    /// Consumer opens pull transfer and provider starts it
    ProcessId startPull() {
      auto process_id =
          consumer.transfer->openTransfer(agreement_id, TransferType::kPull, {});
      EXPECT_TRUE(process_id) << process_id.error().message();
      runUntilIdle();
      return process_id ? process_id.value() : ProcessId{};
    }

    std::string agreement_id;
  };

  /**
   * @given finalized agreement
   * @when consumer opens pull transfer
   * @then both sides are started and consumer holds endpoint and token issued
   * by provider
   */
  TEST_F(TransferCoordinatorTest, PullByConsumer) {
    auto consumer_pid = startPull();

    auto provider_process = providerProcess(TransferState::kStarted);
    EXPECT_EQ(provider_process.role, TransferRole::kProvider);
    EXPECT_EQ(provider_process.agreement_id, agreement_id);
    EXPECT_EQ(provider_process.counterparty_id, "consumer");
    EXPECT_EQ(provider_process.counterparty_pid, consumer_pid);
    EXPECT_EQ(provider_process.address, (DataAddress{"Asset", "asset-1", {}}));
    EXPECT_FALSE(provider_process.token_id.empty());
    EXPECT_TRUE(provider_process.token.empty());

    auto consumer_process = process(consumer, consumer_pid);
    EXPECT_EQ(consumer_process.state, TransferState::kStarted);
    EXPECT_EQ(consumer_process.role, TransferRole::kConsumer);
    EXPECT_EQ(consumer_process.counterparty_pid, provider_process.id);
    EXPECT_EQ(consumer_process.endpoint.endpoint,
              "http://provider/" + provider_process.id);
    EXPECT_TRUE(consumer_process.token_id.empty());

    EXPECT_OUTCOME_TRUE(
        verified,
        provider.claims->verifyPresentation({"", consumer_process.token}));
    EXPECT_EQ(verified.subject, provider_process.id);
    EXPECT_EQ(verified.id, provider_process.token_id);
  }

  /**
   * @given network acknowledging after the receiver handled the message
   * @when provider starts the transfer before openTransfer returns
   * @then the start is redelivered after the consumer process is stored
   */
  TEST_F(TransferCoordinatorTest, StartBeforeOpenReturns) {
    network->setInline(true);
    EXPECT_OUTCOME_TRUE(
        consumer_pid,
        consumer.transfer->openTransfer(agreement_id, TransferType::kPull, {}));
    EXPECT_EQ(process(consumer, consumer_pid).state, TransferState::kRequested);
    EXPECT_EQ(network->rejected(), 1);
    auto provider_process = providerProcess(TransferState::kStarted);

    runUntilIdle();
    auto consumer_process = process(consumer, consumer_pid);
    EXPECT_EQ(consumer_process.state, TransferState::kStarted);
    EXPECT_EQ(consumer_process.counterparty_pid, provider_process.id);
    EXPECT_FALSE(consumer_process.token.empty());
  }

  /**
   * @given finalized agreement
   * @when provider requests pull transfer on its own data plane
   * @then edr is returned and process is started without counterparty pid
   */
  TEST_F(TransferCoordinatorTest, PullByProvider) {
    const DataAddress source{"Asset", "asset-1", {}};
    EXPECT_OUTCOME_TRUE(
        started,
        provider.transfer->requestTransfer(
            agreement_id, TransferType::kPull, source));
    ASSERT_TRUE(started.edr);
    EXPECT_EQ(started.edr->process_id, started.process_id);
    EXPECT_EQ(started.edr->endpoint.endpoint,
              "http://provider/" + started.process_id);

    auto provider_process = process(provider, started.process_id);
    EXPECT_EQ(provider_process.state, TransferState::kStarted);
    EXPECT_EQ(provider_process.counterparty_id, "consumer");
    EXPECT_TRUE(provider_process.counterparty_pid.empty());
    EXPECT_EQ(provider_process.token_id, started.edr->token_id);
    EXPECT_OUTCOME_TRUE_1(
        provider.claims->verifyPresentation({"", started.edr->token}))

    // nothing is sent to the consumer that has no process
    EXPECT_OUTCOME_TRUE_1(
        provider.transfer->terminate(started.process_id,
                                     TerminationReason::kManual))
    runUntilIdle();
    EXPECT_EQ(process(provider, started.process_id).state,
              TransferState::kTerminated);
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kRevoked,
        provider.claims->verifyPresentation({"", started.edr->token}));
  }

  /**
   * @given participants
   * @when transfer of unknown agreement or by the wrong side is requested
   * @then request fails and no process is created
   */
  TEST_F(TransferCoordinatorTest, NotAgreed) {
    EXPECT_OUTCOME_ERROR(
        TransferError::kContractNotAgreed,
        consumer.transfer->openTransfer("unknown", TransferType::kPull, {}));
    EXPECT_OUTCOME_ERROR(
        TransferError::kContractNotAgreed,
        provider.transfer->requestTransfer("unknown", TransferType::kPull, {}));
    EXPECT_OUTCOME_ERROR(
        TransferError::kWrongRole,
        provider.transfer->openTransfer(agreement_id, TransferType::kPull, {}));

    EXPECT_OUTCOME_TRUE(requested,
                        consumer.transfer->listByState(TransferState::kRequested));
    EXPECT_TRUE(requested.empty());
    EXPECT_OUTCOME_TRUE(ended,
                        provider.transfer->listByState(TransferState::kTerminated));
    EXPECT_TRUE(ended.empty());
  }

  /**
   * @given finalized agreement
   * @when consumer opens push transfer to its destination
   * @then provider provisions push to the destination and consumer gets no
   * token
   */
  TEST_F(TransferCoordinatorTest, Push) {
    const DataAddress destination{"HttpData", "http://consumer/sink", {}};
    EXPECT_CALL(*provider_plane,
                provision(_, TransferType::kPush, destination, _))
        .WillOnce(Return(outcome::result<DataAddress>{destination}));

    EXPECT_OUTCOME_TRUE(
        consumer_pid,
        consumer.transfer->openTransfer(
            agreement_id, TransferType::kPush, destination));
    runUntilIdle();

    auto provider_process = providerProcess(TransferState::kStarted);
    EXPECT_EQ(provider_process.type, TransferType::kPush);
    EXPECT_EQ(provider_process.address, destination);

    auto consumer_process = process(consumer, consumer_pid);
    EXPECT_EQ(consumer_process.state, TransferState::kStarted);
    EXPECT_EQ(consumer_process.address, destination);
    EXPECT_TRUE(consumer_process.token.empty());
  }

  /**
   * @given started pull transfer
   * @when consumer suspends and then resumes it
   * @then both sides follow, token is revoked on suspend and a new one is
   * delivered on resume
   */
  TEST_F(TransferCoordinatorTest, SuspendResume) {
    auto consumer_pid = startPull();
    const auto old_token = process(consumer, consumer_pid).token;

    EXPECT_OUTCOME_TRUE_1(consumer.transfer->suspend(consumer_pid))
    runUntilIdle();
    auto suspended = process(consumer, consumer_pid);
    EXPECT_EQ(suspended.state, TransferState::kSuspended);
    EXPECT_TRUE(suspended.token.empty());
    auto provider_process = providerProcess(TransferState::kSuspended);
    EXPECT_TRUE(provider_process.token_id.empty());
    EXPECT_OUTCOME_ERROR(ClaimsError::kRevoked,
                         provider.claims->verifyPresentation({"", old_token}));

    EXPECT_OUTCOME_TRUE(edr, consumer.transfer->resume(consumer_pid));
    EXPECT_FALSE(edr);
    runUntilIdle();
    auto resumed = process(consumer, consumer_pid);
    EXPECT_EQ(resumed.state, TransferState::kStarted);
    EXPECT_NE(resumed.token, old_token);
    EXPECT_OUTCOME_TRUE_1(
        provider.claims->verifyPresentation({"", resumed.token}))
    EXPECT_EQ(process(provider, provider_process.id).state,
              TransferState::kStarted);

    // suspend of suspended transfer is rejected
    EXPECT_OUTCOME_TRUE_1(provider.transfer->suspend(provider_process.id))
    EXPECT_OUTCOME_ERROR(TransferError::kInvalidStateTransition,
                         provider.transfer->suspend(provider_process.id));
    runUntilIdle();
    EXPECT_EQ(process(consumer, consumer_pid).state,
              TransferState::kSuspended);
  }

  /**
   * @given started pull transfer
   * @when consumer completes it
   * @then both sides are completed and provider flow is torn down
   */
  TEST_F(TransferCoordinatorTest, Complete) {
    auto consumer_pid = startPull();
    auto provider_process = providerProcess(TransferState::kStarted);
    EXPECT_CALL(*provider_plane, teardown(provider_process.id))
        .WillOnce(Return(outcome::success()));

    EXPECT_OUTCOME_TRUE_1(consumer.transfer->complete(consumer_pid))
    runUntilIdle();

    auto completed = process(consumer, consumer_pid);
    EXPECT_EQ(completed.state, TransferState::kCompleted);
    EXPECT_EQ(completed.termination_reason, TerminationReason::kCompleted);
    EXPECT_TRUE(completed.token.empty());
    EXPECT_EQ(process(provider, provider_process.id).state,
              TransferState::kCompleted);

    // ended transfer stays as is
    EXPECT_OUTCOME_TRUE_1(
        consumer.transfer->terminate(consumer_pid, TerminationReason::kManual))
    EXPECT_EQ(process(consumer, consumer_pid).state, TransferState::kCompleted);
    EXPECT_OUTCOME_ERROR(TransferError::kInvalidStateTransition,
                         consumer.transfer->resume(consumer_pid));
  }

  /**
   * @given started pull transfer
   * @when provider terminates it for policy violation
   * @then consumer is terminated with the same reason
   */
  TEST_F(TransferCoordinatorTest, Terminate) {
    auto consumer_pid = startPull();
    auto provider_process = providerProcess(TransferState::kStarted);

    EXPECT_OUTCOME_TRUE_1(provider.transfer->terminate(
        provider_process.id, TerminationReason::kPolicyViolation))
    runUntilIdle();

    auto terminated = process(consumer, consumer_pid);
    EXPECT_EQ(terminated.state, TransferState::kTerminated);
    EXPECT_EQ(terminated.termination_reason,
              TerminationReason::kPolicyViolation);
    auto provider_terminated = process(provider, provider_process.id);
    EXPECT_EQ(provider_terminated.termination_reason,
              TerminationReason::kPolicyViolation);
    EXPECT_OUTCOME_TRUE(flow,
                        provider.signaling->getFlow(provider_process.id));
    EXPECT_EQ(flow.state, signaling::DataFlowState::kTerminated);
  }

  /**
   * @given started pull transfer and unreachable consumer
   * @when provider suspends the transfer
   * @then retries are exhausted and provider terminates the transfer
   */
  TEST_F(TransferCoordinatorTest, UnreachableCounterparty) {
    auto consumer_pid = startPull();
    auto provider_process = providerProcess(TransferState::kStarted);

    network->setReachable("consumer", false);
    EXPECT_OUTCOME_TRUE_1(provider.transfer->suspend(provider_process.id))
    runUntilIdle();

    auto terminated = process(provider, provider_process.id);
    EXPECT_EQ(terminated.state, TransferState::kTerminated);
    EXPECT_EQ(terminated.termination_reason,
              TerminationReason::kCounterpartyUnreachable);
    EXPECT_EQ(process(consumer, consumer_pid).state, TransferState::kStarted);
  }

  /**
   * @given unreachable provider
   * @when consumer opens transfer
   * @then request is queued and consumer terminates after retries
   */
  TEST_F(TransferCoordinatorTest, UnreachableProvider) {
    network->setReachable("provider", false);
    EXPECT_OUTCOME_TRUE(
        consumer_pid,
        consumer.transfer->openTransfer(agreement_id, TransferType::kPull, {}));
    EXPECT_EQ(process(consumer, consumer_pid).state, TransferState::kRequested);
    runUntilIdle();

    auto terminated = process(consumer, consumer_pid);
    EXPECT_EQ(terminated.state, TransferState::kTerminated);
    EXPECT_EQ(terminated.termination_reason,
              TerminationReason::kCounterpartyUnreachable);
  }

  /**
   * @given provider data plane failing to provision
   * @when transfer is requested by either side
   * @then process ends with system error on both sides
   */
  TEST_F(TransferCoordinatorTest, ProvisionFailure) {
    ON_CALL(*provider_plane, provision(_, _, _, _))
        .WillByDefault(
            Return(outcome::failure(std::make_error_code(std::errc::io_error))));

    EXPECT_OUTCOME_FALSE_1(provider.transfer->requestTransfer(
        agreement_id, TransferType::kPull, DataAddress{"Asset", "asset-1", {}}))
    auto local = providerProcess(TransferState::kTerminated);
    EXPECT_EQ(local.termination_reason, TerminationReason::kSystemError);

    EXPECT_OUTCOME_TRUE(
        consumer_pid,
        consumer.transfer->openTransfer(agreement_id, TransferType::kPull, {}));
    runUntilIdle();
    auto terminated = process(consumer, consumer_pid);
    EXPECT_EQ(terminated.state, TransferState::kTerminated);
    EXPECT_EQ(terminated.termination_reason, TerminationReason::kSystemError);
    EXPECT_OUTCOME_TRUE(
        ended, provider.transfer->listByState(TransferState::kTerminated));
    EXPECT_EQ(ended.size(), 2);
  }

  /**
   * @given started pull transfer and trigger source attached to provider
   * @when manual suspend and policy violation triggers fire
   * @then transfer is suspended and then terminated on both sides
   */
  TEST_F(TransferCoordinatorTest, Triggers) {
    signaling::ManualTriggerSource triggers;
    attachTriggerSource(provider, triggers);
    auto consumer_pid = startPull();
    auto provider_process = providerProcess(TransferState::kStarted);

    triggers.fire(signaling::ManualTrigger{provider_process.id, true});
    runUntilIdle();
    EXPECT_EQ(process(provider, provider_process.id).state,
              TransferState::kSuspended);
    EXPECT_EQ(process(consumer, consumer_pid).state,
              TransferState::kSuspended);

    triggers.fire(signaling::PolicyMonitorTrigger{provider_process.id, true});
    runUntilIdle();
    auto terminated = process(consumer, consumer_pid);
    EXPECT_EQ(terminated.state, TransferState::kTerminated);
    EXPECT_EQ(terminated.termination_reason,
              TerminationReason::kPolicyViolation);

    EXPECT_OUTCOME_FALSE_1(provider.transfer->handleTrigger(
        signaling::ManualTrigger{"unknown", false}))
  }
}  // namespace ds::node
