/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signaling/impl/signaling_controller_impl.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

#include "claims/claims_error.hpp"
#include "claims/impl/claims_authority_impl.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "process/process_store_error.hpp"
#include "signaling/signaling_error.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/dataspace/claims_config.hpp"
#include "testutil/mocks/claims/claims_authority_mock.hpp"
#include "testutil/mocks/signaling/data_plane_mock.hpp"
#include "testutil/outcome.hpp"

namespace ds::signaling {
  using claims::ClaimsAuthorityImpl;
  using claims::ClaimsAuthorityMock;
  using claims::ClaimsError;
  using claims::Presentation;
  using testing::_;
  using testing::Invoke;
  using testing::NiceMock;
  using testing::Return;

  class SignalingControllerTest : public ::testing::Test {
   public:
    void SetUp() override {
      ON_CALL(*claims, issueToken(_, _))
          .WillByDefault(Invoke(authority.get(), &ClaimsAuthorityImpl::issueToken));
      ON_CALL(*claims, revokeToken(_))
          .WillByDefault(
              Invoke(authority.get(), &ClaimsAuthorityImpl::revokeToken));
      ON_CALL(*claims, findToken(_))
          .WillByDefault(Invoke(authority.get(), &ClaimsAuthorityImpl::findToken));
      ON_CALL(*data_plane, provision(_, _, _, _))
          .WillByDefault(Invoke([](const ProcessId &process_id,
                                   TransferType,
                                   const DataAddress &,
                                   const std::string &) {
            return outcome::result<DataAddress>{
                DataAddress{"HttpData", "http://provider/" + process_id, {}}};
          }));
      ON_CALL(*data_plane, pause(_)).WillByDefault(Return(outcome::success()));
      ON_CALL(*data_plane, resume(_, _))
          .WillByDefault(Return(outcome::success()));
      ON_CALL(*data_plane, teardown(_))
          .WillByDefault(Return(outcome::success()));
    }

    /// Checks whether token jwt is still accepted
    outcome::result<claims::VerifiedClaims> verify(const Edr &edr) const {
      return authority->verifyPresentation(Presentation{"", edr.token});
    }

    std::shared_ptr<ClaimsAuthorityImpl> authority =
        std::make_shared<ClaimsAuthorityImpl>(
            testutil::makeClaimsConfig("provider"),
            std::make_shared<clock::UTCClockImpl>(),
            std::make_shared<storage::InMemoryStorage>(),
            std::make_shared<claims::StaticAttestationSource>());
    std::shared_ptr<NiceMock<ClaimsAuthorityMock>> claims =
        std::make_shared<NiceMock<ClaimsAuthorityMock>>();
    std::shared_ptr<NiceMock<DataPlaneMock>> data_plane =
        std::make_shared<NiceMock<DataPlaneMock>>();
    std::shared_ptr<SignalingControllerImpl> controller =
        std::make_shared<SignalingControllerImpl>(
            claims,
            data_plane,
            std::make_shared<storage::InMemoryStorage>(),
            std::chrono::milliseconds{1000});
    DataAddress source{"Asset", "asset-1", {}};
  };

  /**
   * @given new pull flow
   * @when it is started twice with the same parameters
   * @then data plane is provisioned once and the same valid reference is
   * returned
   */
  TEST_F(SignalingControllerTest, StartPull) {
    EXPECT_CALL(*data_plane, provision("p-1", TransferType::kPull, source, _))
        .Times(1);
    EXPECT_OUTCOME_TRUE(edr, controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(edr);
    EXPECT_EQ(edr->process_id, "p-1");
    EXPECT_EQ(edr->endpoint.endpoint, "http://provider/p-1");
    EXPECT_OUTCOME_TRUE(verified, verify(*edr));
    EXPECT_EQ(verified.claims.at(claims::kProcessIdClaim), "p-1");

    EXPECT_OUTCOME_TRUE(flow, controller->getFlow("p-1"));
    EXPECT_EQ(flow.state, DataFlowState::kStarted);
    EXPECT_EQ(flow.token_id, edr->token_id);

    EXPECT_OUTCOME_TRUE(again,
                        controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(again);
    EXPECT_EQ(again->token_id, edr->token_id);

    EXPECT_OUTCOME_ERROR(
        SignalingError::kParametersMismatch,
        controller->start("p-1", TransferType::kPush, source));
  }

  /**
   * @given new push flow
   * @when it is started
   * @then no reference is returned
   */
  TEST_F(SignalingControllerTest, StartPush) {
    DataAddress destination{"HttpData", "http://consumer/sink", {}};
    EXPECT_OUTCOME_TRUE(
        edr, controller->start("p-1", TransferType::kPush, destination));
    EXPECT_FALSE(edr);
    EXPECT_OUTCOME_TRUE(flow, controller->getFlow("p-1"));
    EXPECT_EQ(flow.state, DataFlowState::kStarted);
    EXPECT_FALSE(flow.token_id.empty());
  }

  /**
   * @given started pull flow
   * @when it is suspended and resumed
   * @then old token is revoked, resume mints a new valid one
   */
  TEST_F(SignalingControllerTest, SuspendResume) {
    EXPECT_OUTCOME_TRUE(edr, controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(edr);

    EXPECT_CALL(*data_plane, pause("p-1")).Times(1);
    EXPECT_OUTCOME_TRUE_1(controller->suspend("p-1"))
    EXPECT_OUTCOME_ERROR(ClaimsError::kRevoked, verify(*edr));
    EXPECT_OUTCOME_TRUE(suspended, controller->getFlow("p-1"));
    EXPECT_EQ(suspended.state, DataFlowState::kSuspended);
    EXPECT_TRUE(suspended.token_id.empty());

    EXPECT_OUTCOME_ERROR(SignalingError::kInvalidStateTransition,
                         controller->suspend("p-1"));

    EXPECT_CALL(*data_plane, resume("p-1", _)).Times(1);
    EXPECT_OUTCOME_TRUE(resumed, controller->resume("p-1"));
    ASSERT_TRUE(resumed);
    EXPECT_NE(resumed->token_id, edr->token_id);
    EXPECT_OUTCOME_TRUE_1(verify(*resumed))
    EXPECT_OUTCOME_TRUE(started, controller->getFlow("p-1"));
    EXPECT_EQ(started.state, DataFlowState::kStarted);
  }

  /**
   * @given suspended pull flow
   * @when it is started twice with the same parameters
   * @then one new token is minted and both calls return the same reference
   */
  TEST_F(SignalingControllerTest, StartTwiceAfterSuspend) {
    EXPECT_OUTCOME_TRUE(edr, controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(edr);
    EXPECT_OUTCOME_TRUE_1(controller->suspend("p-1"))

    EXPECT_CALL(*claims, issueToken("p-1", TransferType::kPull)).Times(1);
    EXPECT_CALL(*data_plane, resume("p-1", _)).Times(1);
    EXPECT_OUTCOME_TRUE(first,
                        controller->start("p-1", TransferType::kPull, source));
    EXPECT_OUTCOME_TRUE(second,
                        controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->token_id, second->token_id);
    EXPECT_EQ(first->token, second->token);
    EXPECT_EQ(first->endpoint, edr->endpoint);
    EXPECT_NE(first->token_id, edr->token_id);
    EXPECT_OUTCOME_TRUE_1(verify(*second))
    EXPECT_OUTCOME_ERROR(ClaimsError::kRevoked, verify(*edr));
  }

  /**
   * @given started pull flow and data plane failing to pause
   * @when flow is suspended
   * @then error is returned and the flow keeps serving a valid token
   */
  TEST_F(SignalingControllerTest, PauseFailure) {
    EXPECT_OUTCOME_TRUE(edr, controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(edr);

    EXPECT_CALL(*data_plane, pause("p-1"))
        .WillOnce(Return(outcome::failure(
            std::make_error_code(std::errc::io_error))));
    EXPECT_CALL(*claims, revokeToken(_)).Times(0);
    EXPECT_OUTCOME_FALSE_1(controller->suspend("p-1"))

    EXPECT_OUTCOME_TRUE(flow, controller->getFlow("p-1"));
    EXPECT_EQ(flow.state, DataFlowState::kStarted);
    EXPECT_OUTCOME_TRUE(again,
                        controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(again);
    EXPECT_EQ(again->token_id, edr->token_id);
    EXPECT_OUTCOME_TRUE_1(verify(*again))
  }

  /**
   * @given started pull flow and token that cannot be revoked
   * @when flow is suspended
   * @then paused data plane is resumed with the live token
   */
  TEST_F(SignalingControllerTest, RevokeFailure) {
    EXPECT_OUTCOME_TRUE(edr, controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(edr);

    EXPECT_CALL(*claims, revokeToken(edr->token_id))
        .WillOnce(Return(outcome::failure(
            std::make_error_code(std::errc::io_error))));
    EXPECT_CALL(*data_plane, pause("p-1")).Times(1);
    EXPECT_CALL(*data_plane, resume("p-1", edr->token)).Times(1);
    EXPECT_OUTCOME_FALSE_1(controller->suspend("p-1"))

    EXPECT_OUTCOME_TRUE(flow, controller->getFlow("p-1"));
    EXPECT_EQ(flow.state, DataFlowState::kStarted);
    EXPECT_EQ(flow.token_id, edr->token_id);
    EXPECT_OUTCOME_TRUE_1(verify(*edr))
  }

  /**
   * @given started flow
   * @when it is terminated twice
   * @then token is revoked and resources released once, restart is rejected
   */
  TEST_F(SignalingControllerTest, Terminate) {
    EXPECT_OUTCOME_TRUE(edr, controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(edr);

    EXPECT_CALL(*claims, revokeToken(edr->token_id)).Times(1);
    EXPECT_CALL(*data_plane, teardown("p-1")).Times(1);
    EXPECT_OUTCOME_TRUE_1(
        controller->terminate("p-1", TerminationReason::kManual))
    EXPECT_OUTCOME_TRUE_1(
        controller->terminate("p-1", TerminationReason::kTimeout))
    EXPECT_OUTCOME_ERROR(ClaimsError::kRevoked, verify(*edr));

    EXPECT_OUTCOME_TRUE(flow, controller->getFlow("p-1"));
    EXPECT_EQ(flow.state, DataFlowState::kTerminated);
    EXPECT_EQ(flow.termination_reason, TerminationReason::kManual);

    EXPECT_OUTCOME_ERROR(SignalingError::kInvalidStateTransition,
                         controller->start("p-1", TransferType::kPull, source));
    EXPECT_OUTCOME_ERROR(SignalingError::kInvalidStateTransition,
                         controller->suspend("p-1"));
    EXPECT_OUTCOME_ERROR(SignalingError::kInvalidStateTransition,
                         controller->terminate("p-2", TerminationReason::kManual));
  }

  /**
   * @given started flow
   * @when several threads terminate it at once
   * @then every call succeeds and the token is revoked exactly once
   */
  TEST_F(SignalingControllerTest, ConcurrentTerminate) {
    EXPECT_OUTCOME_TRUE(edr, controller->start("p-1", TransferType::kPull, source));
    ASSERT_TRUE(edr);

    EXPECT_CALL(*claims, revokeToken(_)).Times(1);
    EXPECT_CALL(*data_plane, teardown("p-1")).Times(1);
    std::atomic_int succeeded{0};
    std::vector<std::thread> threads;
    for (auto i = 0; i < 4; ++i) {
      threads.emplace_back([&] {
        if (controller->terminate("p-1", TerminationReason::kManual)) {
          ++succeeded;
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    EXPECT_EQ(succeeded.load(), 4);
    EXPECT_OUTCOME_TRUE(flow, controller->getFlow("p-1"));
    EXPECT_EQ(flow.state, DataFlowState::kTerminated);
  }

  /**
   * @given data plane failing to provision
   * @when flow is started
   * @then error is returned, minted token is revoked and no flow is stored
   */
  TEST_F(SignalingControllerTest, ProvisionFailure) {
    EXPECT_CALL(*data_plane, provision(_, _, _, _))
        .WillOnce(Return(outcome::failure(
            std::make_error_code(std::errc::io_error))));
    EXPECT_CALL(*claims, revokeToken(_)).Times(1);
    EXPECT_OUTCOME_FALSE_1(
        controller->start("p-1", TransferType::kPull, source))
    EXPECT_OUTCOME_ERROR(process::ProcessStoreError::kNotFound,
                         controller->getFlow("p-1"));
  }

  /**
   * @given triggers of every kind
   * @when they are decided
   * @then suspend or terminate with the matching reason is chosen
   */
  TEST_F(SignalingControllerTest, Decide) {
    auto policy = decide(PolicyMonitorTrigger{"p-1", true});
    EXPECT_FALSE(policy.suspend);
    EXPECT_EQ(policy.reason, TerminationReason::kPolicyViolation);
    EXPECT_EQ(decide(PolicyMonitorTrigger{"p-1", false}).reason,
              TerminationReason::kTimeout);
    EXPECT_TRUE(decide(RemoteMessageTrigger{"p-1", true}).suspend);
    EXPECT_EQ(decide(RemoteMessageTrigger{"p-1", false}).reason,
              TerminationReason::kCounterpartyAbort);
    EXPECT_TRUE(decide(ManualTrigger{"p-1", true}).suspend);
    EXPECT_EQ(decide(ManualTrigger{"p-1", false}).reason,
              TerminationReason::kManual);
    auto error = decide(SystemErrorTrigger{"p-2", "disk"});
    EXPECT_EQ(error.process_id, "p-2");
    EXPECT_EQ(error.reason, TerminationReason::kSystemError);
  }

  /**
   * @given started flow and manual trigger source bound to the controller
   * @when suspend and policy violation triggers are fired
   * @then flow is suspended and then terminated
   */
  TEST_F(SignalingControllerTest, Triggers) {
    EXPECT_OUTCOME_TRUE_1(controller->start("p-1", TransferType::kPull, source))
    ManualTriggerSource triggers;
    std::vector<outcome::result<void>> results;
    triggers.setHandler([&](const Trigger &trigger) {
      results.push_back(controller->handleTrigger(trigger));
    });

    triggers.fire(ManualTrigger{"p-1", true});
    EXPECT_OUTCOME_TRUE(suspended, controller->getFlow("p-1"));
    EXPECT_EQ(suspended.state, DataFlowState::kSuspended);

    triggers.fire(PolicyMonitorTrigger{"p-1", true});
    EXPECT_OUTCOME_TRUE(terminated, controller->getFlow("p-1"));
    EXPECT_EQ(terminated.state, DataFlowState::kTerminated);
    EXPECT_EQ(terminated.termination_reason,
              TerminationReason::kPolicyViolation);

    ASSERT_EQ(results.size(), 2);
    EXPECT_TRUE(results[0]);
    EXPECT_TRUE(results[1]);
  }
}  // namespace ds::signaling
