/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/retrying_sender.hpp"

#include <gtest/gtest.h>

#include "protocol/protocol_error.hpp"
#include "testutil/mocks/protocol/transport_mock.hpp"
#include "testutil/outcome.hpp"

namespace ds::protocol {
  using std::chrono::milliseconds;
  using testing::_;
  using testing::Return;
  using testing::SaveArg;

  class RetryingSenderTest : public ::testing::Test {
   public:
    void SetUp() override {
      identity->setPresentation("presentation");
    }

    std::shared_ptr<RetryingSender> makeSender(uint64_t max_attempts) {
      return std::make_shared<RetryingSender>(
          transport,
          io,
          identity,
          RetryConfig{max_attempts, milliseconds{1}, milliseconds{2},
                      milliseconds{100}});
    }

    Message message() const {
      Message message;
      message.type = MessageType::kTransferSuspension;
      message.consumer_pid = "c-1";
      return message;
    }

    /// Sink for exhausted retries
    void onExhausted(const ProcessId &process_id, const Message &message) {
      exhausted.emplace_back(process_id, message.message_id);
    }

    std::shared_ptr<TransportMock> transport =
        std::make_shared<TransportMock>();
    std::shared_ptr<boost::asio::io_context> io =
        std::make_shared<boost::asio::io_context>();
    std::shared_ptr<Identity> identity = std::make_shared<Identity>("consumer");
    std::vector<std::pair<ProcessId, std::string>> exhausted;
    RetryingSender::ExhaustedCallback callback =
        [this](const ProcessId &process_id, const Message &message) {
          onExhausted(process_id, message);
        };
  };

  /**
   * @given reachable counterparty
   * @when message is sent
   * @then it is delivered at once with sender header fields stamped
   */
  TEST_F(RetryingSenderTest, Delivered) {
    auto sender = makeSender(2);
    Message sent;
    EXPECT_CALL(*transport, send("provider", _, milliseconds{100}))
        .WillOnce(testing::DoAll(SaveArg<1>(&sent),
                                 Return(outcome::success())));
    EXPECT_OUTCOME_EQ(sender->send("provider", "c-1", message(), callback),
                      DeliveryStatus::kDelivered);
    EXPECT_EQ(sent.sender, "consumer");
    EXPECT_EQ(sent.presentation, "presentation");
    EXPECT_FALSE(sent.message_id.empty());
    EXPECT_EQ(sender->pending("c-1"), 0);
  }

  /**
   * @given counterparty failing once
   * @when message is sent and io is run
   * @then message is queued and delivered by retry with the same id
   */
  TEST_F(RetryingSenderTest, DeliveredOnRetry) {
    auto sender = makeSender(2);
    Message first;
    Message second;
    EXPECT_CALL(*transport, send("provider", _, _))
        .WillOnce(testing::DoAll(
            SaveArg<1>(&first), Return(ProtocolError::kDeliveryFailed)))
        .WillOnce(
            testing::DoAll(SaveArg<1>(&second), Return(outcome::success())));
    EXPECT_OUTCOME_EQ(sender->send("provider", "c-1", message(), callback),
                      DeliveryStatus::kQueued);
    EXPECT_EQ(sender->pending("c-1"), 1);
    io->run();
    EXPECT_EQ(sender->pending("c-1"), 0);
    EXPECT_EQ(first.message_id, second.message_id);
    EXPECT_TRUE(exhausted.empty());
  }

  /**
   * @given unreachable counterparty and two retries
   * @when message is sent and io is run
   * @then transport is called three times and exhaustion is reported once
   */
  TEST_F(RetryingSenderTest, Exhausted) {
    auto sender = makeSender(2);
    EXPECT_CALL(*transport, send("provider", _, _))
        .Times(3)
        .WillRepeatedly(Return(ProtocolError::kDeliveryFailed));
    auto msg = message();
    msg.message_id = "m-1";
    EXPECT_OUTCOME_EQ(sender->send("provider", "c-1", msg, callback),
                      DeliveryStatus::kQueued);
    io->run();
    ASSERT_EQ(exhausted.size(), 1);
    EXPECT_EQ(exhausted[0].first, "c-1");
    EXPECT_EQ(exhausted[0].second, "m-1");
    EXPECT_EQ(sender->pending("c-1"), 0);
  }

  /**
   * @given no retries configured
   * @when first attempt fails
   * @then kCounterpartyUnreachable is returned and nothing is queued
   */
  TEST_F(RetryingSenderTest, NoRetries) {
    auto sender = makeSender(0);
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce(Return(ProtocolError::kDeliveryFailed));
    EXPECT_OUTCOME_ERROR(ProtocolError::kCounterpartyUnreachable,
                         sender->send("provider", "c-1", message(), callback));
    EXPECT_EQ(sender->pending("c-1"), 0);
    EXPECT_TRUE(exhausted.empty());
  }

  /**
   * @given queued message
   * @when retries of its process are cancelled
   * @then no more attempts are made and exhaustion is not reported
   */
  TEST_F(RetryingSenderTest, Cancel) {
    auto sender = makeSender(3);
    EXPECT_CALL(*transport, send(_, _, _))
        .WillOnce(Return(ProtocolError::kDeliveryFailed));
    EXPECT_OUTCOME_TRUE_1(sender->send("provider", "c-1", message(), callback))
    sender->cancel("c-1");
    EXPECT_EQ(sender->pending("c-1"), 0);
    io->run();
    EXPECT_TRUE(exhausted.empty());
  }

  /**
   * @given initial delay and max delay
   * @then backoff doubles up to max delay
   */
  TEST_F(RetryingSenderTest, Backoff) {
    auto sender = std::make_shared<RetryingSender>(
        transport,
        io,
        identity,
        RetryConfig{5, milliseconds{100}, milliseconds{1000}, milliseconds{1}});
    EXPECT_EQ(sender->backoff(0), milliseconds{100});
    EXPECT_EQ(sender->backoff(1), milliseconds{200});
    EXPECT_EQ(sender->backoff(3), milliseconds{800});
    EXPECT_EQ(sender->backoff(4), milliseconds{1000});
    EXPECT_EQ(sender->backoff(60), milliseconds{1000});
  }
}  // namespace ds::protocol
