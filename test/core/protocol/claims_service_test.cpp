/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/claims_service.hpp"

#include <gtest/gtest.h>

#include "claims/claims_error.hpp"
#include "claims/impl/claims_authority_impl.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "protocol/protocol_error.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/dataspace/claims_config.hpp"
#include "testutil/dataspace/loopback_transport.hpp"
#include "testutil/outcome.hpp"

namespace ds::protocol {
  using claims::ClaimsAuthorityImpl;
  using claims::ClaimsError;
  using claims::StaticAttestationSource;
  using std::chrono::milliseconds;

  /// Claims stack of one participant attached to the loopback network
  struct ClaimsNode {
    ClaimsNode(const std::shared_ptr<LoopbackNetwork> &network,
               const std::shared_ptr<boost::asio::io_context> &io,
               const ParticipantId &id,
               uint64_t max_attempts)
        : identity{std::make_shared<Identity>(id)},
          attestation{std::make_shared<StaticAttestationSource>()},
          authority{std::make_shared<ClaimsAuthorityImpl>(
              testutil::makeClaimsConfig(id),
              std::make_shared<clock::UTCClockImpl>(),
              std::make_shared<storage::InMemoryStorage>(),
              attestation)},
          transport{std::make_shared<LoopbackTransport>(network, id)},
          dispatcher{std::make_shared<MessageDispatcher>()},
          sender{std::make_shared<RetryingSender>(
              transport,
              io,
              identity,
              config::RetryConfig{max_attempts, milliseconds{1},
                                  milliseconds{2}, milliseconds{100}})},
          service{std::make_shared<ClaimsService>(
              authority, sender, io, milliseconds{50})} {
      dispatcher->attach(*transport);
      service->subscribe(*dispatcher);
    }

    std::shared_ptr<Identity> identity;
    std::shared_ptr<StaticAttestationSource> attestation;
    std::shared_ptr<ClaimsAuthorityImpl> authority;
    std::shared_ptr<LoopbackTransport> transport;
    std::shared_ptr<MessageDispatcher> dispatcher;
    std::shared_ptr<RetryingSender> sender;
    std::shared_ptr<ClaimsService> service;
  };

  class ClaimsServiceTest : public ::testing::Test {
   public:
    void SetUp() override {
      issuer.attestation->entitle("holder", {{"participant", "holder"}});
    }

    void runUntilIdle() {
      io->restart();
      io->run();
    }

    std::shared_ptr<boost::asio::io_context> io =
        std::make_shared<boost::asio::io_context>();
    std::shared_ptr<LoopbackNetwork> network =
        std::make_shared<LoopbackNetwork>(io);
    ClaimsNode issuer{network, io, "issuer", 1};
    ClaimsNode holder{network, io, "holder", 0};
  };

  /**
   * @given holder entitled by issuer
   * @when holder requests credential over the network
   * @then issued jwt verifies at the issuer
   */
  TEST_F(ClaimsServiceTest, RequestCredential) {
    boost::optional<outcome::result<std::string>> received;
    EXPECT_OUTCOME_TRUE_1(holder.service->requestCredential(
        "issuer",
        {{"participant", "holder"}},
        [&](outcome::result<std::string> credential) {
          received = std::move(credential);
        }));
    runUntilIdle();
    ASSERT_TRUE(received);
    EXPECT_OUTCOME_TRUE(jwt, *received);
    EXPECT_OUTCOME_TRUE(verified,
                        issuer.authority->verifyPresentation({"holder", jwt}));
    EXPECT_EQ(verified.claims.at("participant"), "holder");
  }

  /**
   * @given holder asking for claims it is not entitled to
   * @when credential is requested
   * @then callback receives kIssuanceDenied
   */
  TEST_F(ClaimsServiceTest, CredentialDenied) {
    boost::optional<outcome::result<std::string>> received;
    EXPECT_OUTCOME_TRUE_1(holder.service->requestCredential(
        "issuer",
        {{"participant", "issuer"}},
        [&](outcome::result<std::string> credential) {
          received = std::move(credential);
        }));
    runUntilIdle();
    ASSERT_TRUE(received);
    EXPECT_OUTCOME_ERROR(ClaimsError::kIssuanceDenied, *received);
  }

  /**
   * @given holder presenting credential of the issuer
   * @when issuer queries the presentation
   * @then verified claims of the holder are received
   */
  TEST_F(ClaimsServiceTest, QueryPresentation) {
    EXPECT_OUTCOME_TRUE(credential,
                        issuer.authority->issueCredential(
                            "holder", {{"participant", "holder"}}));
    holder.identity->setPresentation(credential.signature);

    boost::optional<outcome::result<claims::VerifiedClaims>> received;
    EXPECT_OUTCOME_TRUE_1(issuer.service->queryPresentation(
        "holder", [&](outcome::result<claims::VerifiedClaims> verified) {
          received = std::move(verified);
        }));
    runUntilIdle();
    ASSERT_TRUE(received);
    EXPECT_OUTCOME_TRUE(verified, *received);
    EXPECT_EQ(verified.subject, "holder");
    EXPECT_EQ(verified.id, credential.id);
  }

  /**
   * @given credential revoked by issuer
   * @when holder checks revocation before and after
   * @then false and then true are received
   */
  TEST_F(ClaimsServiceTest, CheckRevocation) {
    EXPECT_OUTCOME_TRUE(credential,
                        issuer.authority->issueCredential("holder", {}));
    std::vector<bool> answers;
    auto collect = [&](outcome::result<bool> revoked) {
      ASSERT_TRUE(revoked);
      answers.push_back(revoked.value());
    };
    EXPECT_OUTCOME_TRUE_1(
        holder.service->checkRevocation("issuer", credential.id, collect))
    runUntilIdle();
    EXPECT_OUTCOME_TRUE_1(issuer.authority->revokeCredential(credential.id))
    EXPECT_OUTCOME_TRUE_1(
        holder.service->checkRevocation("issuer", credential.id, collect))
    runUntilIdle();
    EXPECT_EQ(answers, (std::vector<bool>{false, true}));
  }

  /**
   * @given unreachable counterparty
   * @when requests are sent with and without retries
   * @then error is returned at once or reported after retries
   */
  TEST_F(ClaimsServiceTest, Unreachable) {
    network->setReachable("issuer", false);
    network->setReachable("holder", false);
    EXPECT_OUTCOME_ERROR(ProtocolError::kCounterpartyUnreachable,
                         holder.service->requestCredential(
                             "issuer", {}, [](auto) { FAIL(); }));

    boost::optional<outcome::result<claims::VerifiedClaims>> received;
    EXPECT_OUTCOME_TRUE_1(issuer.service->queryPresentation(
        "holder", [&](outcome::result<claims::VerifiedClaims> verified) {
          received = std::move(verified);
        }));
    runUntilIdle();
    ASSERT_TRUE(received);
    EXPECT_OUTCOME_ERROR(ProtocolError::kCounterpartyUnreachable, *received);
  }

  /**
   * @given holder presenting a credential the issuer does not accept
   * @when holder requests credential
   * @then request is denied
   */
  TEST_F(ClaimsServiceTest, UnverifiedPresentation) {
    holder.identity->setPresentation("not-a-jwt");
    boost::optional<outcome::result<std::string>> received;
    EXPECT_OUTCOME_TRUE_1(holder.service->requestCredential(
        "issuer",
        {{"participant", "holder"}},
        [&](outcome::result<std::string> credential) {
          received = std::move(credential);
        }));
    runUntilIdle();
    ASSERT_TRUE(received);
    EXPECT_OUTCOME_ERROR(ClaimsError::kIssuanceDenied, *received);
  }

  /**
   * @given holder presenting a credential of the issuer
   * @when holder requests further claims
   * @then presentation is verified and credential issued
   */
  TEST_F(ClaimsServiceTest, VerifiedPresentation) {
    EXPECT_OUTCOME_TRUE(credential,
                        issuer.authority->issueCredential(
                            "holder", {{"participant", "holder"}}));
    holder.identity->setPresentation(credential.signature);
    boost::optional<outcome::result<std::string>> received;
    EXPECT_OUTCOME_TRUE_1(holder.service->requestCredential(
        "issuer",
        {{"participant", "holder"}},
        [&](outcome::result<std::string> issued) {
          received = std::move(issued);
        }));
    runUntilIdle();
    ASSERT_TRUE(received);
    EXPECT_OUTCOME_TRUE_1(*received)
  }

  /**
   * @given counterparty acknowledging requests without ever answering
   * @when credential is requested
   * @then callback receives kCounterpartyUnreachable after the reply timeout
   */
  TEST_F(ClaimsServiceTest, Unanswered) {
    size_t requests = 0;
    network->attach("silent", [&](const Message &) {
      ++requests;
      return outcome::success();
    });
    boost::optional<outcome::result<std::string>> received;
    EXPECT_OUTCOME_TRUE_1(holder.service->requestCredential(
        "silent", {}, [&](outcome::result<std::string> credential) {
          received = std::move(credential);
        }));
    runUntilIdle();
    EXPECT_EQ(requests, 1);
    ASSERT_TRUE(received);
    EXPECT_OUTCOME_ERROR(ProtocolError::kCounterpartyUnreachable, *received);
  }
}  // namespace ds::protocol
