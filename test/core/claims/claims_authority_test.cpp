/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "claims/impl/claims_authority_impl.hpp"

#include <gtest/gtest.h>

#include "claims/claims_error.hpp"
#include "claims/signing_key.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/dataspace/claims_config.hpp"
#include "testutil/mocks/clock/utc_clock_mock.hpp"
#include "testutil/outcome.hpp"

namespace ds::claims {
  using clock::UTCClockMock;
  using std::chrono::seconds;
  using testing::Invoke;
  using testing::NiceMock;
  using testutil::makeClaimsConfig;

  class ClaimsAuthorityTest : public ::testing::Test {
   public:
    void SetUp() override {
      ON_CALL(*clock, nowUTC()).WillByDefault(Invoke([this]() {
        return now;
      }));
      attestation->entitle("consumer",
                           {{"participant", "consumer"}, {"tier", "gold"}});
    }

    std::shared_ptr<ClaimsAuthorityImpl> makeAuthority(
        const ClaimsConfig &config) {
      return std::make_shared<ClaimsAuthorityImpl>(
          config,
          clock,
          std::make_shared<storage::InMemoryStorage>(),
          attestation);
    }

    seconds now{1700000000};
    std::shared_ptr<NiceMock<UTCClockMock>> clock =
        std::make_shared<NiceMock<UTCClockMock>>();
    std::shared_ptr<StaticAttestationSource> attestation =
        std::make_shared<StaticAttestationSource>();
    ClaimsConfig config = makeClaimsConfig("provider");
    std::shared_ptr<ClaimsAuthorityImpl> authority = makeAuthority(config);
  };

  /**
   * @given subject entitled to claims
   * @when credential is issued and presented by the subject
   * @then presentation is verified with the attested claims
   */
  TEST_F(ClaimsAuthorityTest, IssueVerify) {
    EXPECT_OUTCOME_TRUE(
        credential,
        authority->issueCredential("consumer", {{"participant", "consumer"}}));
    EXPECT_EQ(credential.issuer, "provider");
    EXPECT_EQ(credential.subject, "consumer");
    EXPECT_EQ(credential.expiry, seconds{1700000000 + 3600});

    EXPECT_OUTCOME_TRUE(
        verified,
        authority->verifyPresentation({"consumer", credential.signature}));
    EXPECT_EQ(verified.id, credential.id);
    EXPECT_EQ(verified.issuer, "provider");
    EXPECT_EQ(verified.subject, "consumer");
    EXPECT_EQ(verified.claims, (ClaimSet{{"participant", "consumer"}}));

    EXPECT_OUTCOME_ERROR(
        ClaimsError::kHolderMismatch,
        authority->verifyPresentation({"provider", credential.signature}));
  }

  /**
   * @given subject entitlements
   * @when claims beyond the entitlement are requested
   * @then issuance is denied
   */
  TEST_F(ClaimsAuthorityTest, IssuanceDenied) {
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kIssuanceDenied,
        authority->issueCredential("consumer", {{"tier", "platinum"}}));
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kIssuanceDenied,
        authority->issueCredential("stranger", {{"participant", "stranger"}}));
  }

  /**
   * @given issued credential
   * @when time passes its expiry
   * @then verification fails with kExpired
   */
  TEST_F(ClaimsAuthorityTest, Expired) {
    EXPECT_OUTCOME_TRUE(credential,
                        authority->issueCredential("consumer", {}));
    now += seconds{3600};
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kExpired,
        authority->verifyPresentation({"", credential.signature}));
  }

  /**
   * @given issued credential
   * @when it is revoked, twice
   * @then verification fails with kRevoked, unknown ids are ignored
   */
  TEST_F(ClaimsAuthorityTest, RevokedCredential) {
    EXPECT_OUTCOME_TRUE(credential,
                        authority->issueCredential("consumer", {}));
    EXPECT_OUTCOME_EQ(authority->checkRevocation(credential.id), false);
    EXPECT_OUTCOME_TRUE_1(authority->revokeCredential(credential.id))
    EXPECT_OUTCOME_TRUE_1(authority->revokeCredential(credential.id))
    EXPECT_OUTCOME_TRUE_1(authority->revokeCredential("unknown"))
    EXPECT_OUTCOME_EQ(authority->checkRevocation(credential.id), true);
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kRevoked,
        authority->verifyPresentation({"consumer", credential.signature}));
  }

  /**
   * @given credential issued by another authority
   * @when it is verified before and after its issuer is trusted
   * @then kUntrustedIssuer, then success; a wrong public key gives
   * kInvalidSignature
   */
  TEST_F(ClaimsAuthorityTest, TrustedIssuers) {
    auto other_config = makeClaimsConfig("other");
    auto other = makeAuthority(other_config);
    EXPECT_OUTCOME_TRUE(credential, other->issueCredential("consumer", {}));
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kUntrustedIssuer,
        authority->verifyPresentation({"consumer", credential.signature}));

    EXPECT_OUTCOME_TRUE(wrong_key, generateSigningKey());
    authority->addTrustedIssuer("other", wrong_key.public_key);
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kInvalidSignature,
        authority->verifyPresentation({"consumer", credential.signature}));

    authority->addTrustedIssuer("other", other_config.public_key);
    EXPECT_OUTCOME_TRUE(
        verified,
        authority->verifyPresentation({"consumer", credential.signature}));
    EXPECT_EQ(verified.issuer, "other");
  }

  /**
   * @given authority trusted by provider and another one signing under the
   * provider issuer name with its own key
   * @when credentials of both are verified by the provider
   * @then only the credential signed with the provider key is accepted
   */
  TEST_F(ClaimsAuthorityTest, IssuerNameWithoutKey) {
    auto other_config = makeClaimsConfig("other");
    auto other = makeAuthority(other_config);
    authority->addTrustedIssuer("other", other_config.public_key);

    auto impostor = makeAuthority(makeClaimsConfig("provider"));
    EXPECT_OUTCOME_TRUE(forged, impostor->issueCredential("consumer", {}));
    EXPECT_EQ(forged.issuer, "provider");
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kInvalidSignature,
        authority->verifyPresentation({"consumer", forged.signature}));
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kInvalidSignature,
        other->verifyPresentation({"consumer", forged.signature}));

    other->addTrustedIssuer("provider", config.public_key);
    EXPECT_OUTCOME_TRUE(credential,
                        authority->issueCredential("consumer", {}));
    EXPECT_OUTCOME_TRUE_1(
        other->verifyPresentation({"consumer", credential.signature}))
    EXPECT_OUTCOME_ERROR(
        ClaimsError::kInvalidSignature,
        other->verifyPresentation({"consumer", forged.signature}));
  }

  /**
   * @given generated signing key
   * @when public key is derived from its private key
   * @then it matches the generated public key; garbage gives kInvalidKey
   */
  TEST(SigningKeyTest, DerivePublicKey) {
    EXPECT_OUTCOME_TRUE(key, generateSigningKey());
    EXPECT_OUTCOME_EQ(derivePublicKey(key.private_key), key.public_key);
    EXPECT_OUTCOME_ERROR(ClaimsError::kInvalidKey,
                         derivePublicKey("not a pem key"));
  }

  /**
   * @given garbage instead of jwt
   * @when it is verified
   * @then kMalformed is returned
   */
  TEST_F(ClaimsAuthorityTest, Malformed) {
    EXPECT_OUTCOME_ERROR(ClaimsError::kMalformed,
                         authority->verifyPresentation({"", "not a jwt"}));
    EXPECT_OUTCOME_ERROR(ClaimsError::kMalformed,
                         authority->verifyPresentation({"", ""}));
  }

  /**
   * @given token issued for a process
   * @when token is verified and revoked
   * @then it carries process claims until revocation
   */
  TEST_F(ClaimsAuthorityTest, Token) {
    EXPECT_OUTCOME_TRUE(token,
                        authority->issueToken("p-1", TransferType::kPull));
    EXPECT_EQ(token.process_id, "p-1");
    EXPECT_EQ(token.expiry, seconds{1700000000 + 60});
    EXPECT_FALSE(token.revoked);

    EXPECT_OUTCOME_TRUE(verified, authority->verifyPresentation({"", token.value}));
    EXPECT_EQ(verified.subject, "p-1");
    EXPECT_EQ(verified.claims.at(kProcessIdClaim), "p-1");
    EXPECT_EQ(verified.claims.at(kDirectionClaim),
              primitives::toString(TransferType::kPull));

    EXPECT_OUTCOME_TRUE_1(authority->revokeToken(token.id))
    EXPECT_OUTCOME_TRUE(found, authority->findToken(token.id));
    EXPECT_TRUE(found.revoked);
    EXPECT_OUTCOME_ERROR(ClaimsError::kRevoked,
                         authority->verifyPresentation({"", token.value}));
    EXPECT_OUTCOME_TRUE_1(authority->revokeToken("unknown"))
    EXPECT_OUTCOME_ERROR(ClaimsError::kTokenNotFound,
                         authority->findToken("unknown"));
  }

  /**
   * @given claims error codes
   * @then only verification errors are classified as verification failures
   */
  TEST_F(ClaimsAuthorityTest, VerificationFailures) {
    EXPECT_TRUE(isVerificationFailure(ClaimsError::kRevoked));
    EXPECT_TRUE(isVerificationFailure(ClaimsError::kUntrustedIssuer));
    EXPECT_FALSE(isVerificationFailure(ClaimsError::kIssuanceDenied));
    EXPECT_FALSE(isVerificationFailure(ClaimsError::kTokenNotFound));
  }
}  // namespace ds::claims
