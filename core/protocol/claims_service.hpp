/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/variant.hpp>

#include "claims/claims_authority.hpp"
#include "protocol/message_dispatcher.hpp"
#include "protocol/retrying_sender.hpp"

namespace ds::protocol {
  using claims::ClaimsAuthority;
  using claims::VerifiedClaims;

  /**
   * Serves credential protocol messages from the local claims authority and
   * sends credential requests and queries to other participants. A request
   * without answer within the reply timeout fails with
   * kCounterpartyUnreachable.
   */
  class ClaimsService : public std::enable_shared_from_this<ClaimsService> {
   public:
    /// Receives issued credential jwt
    using CredentialCallback =
        std::function<void(outcome::result<std::string>)>;
    /// Receives verified presentation of the queried holder
    using PresentationCallback =
        std::function<void(outcome::result<VerifiedClaims>)>;
    using RevocationCallback = std::function<void(outcome::result<bool>)>;

    ClaimsService(std::shared_ptr<ClaimsAuthority> authority,
                  std::shared_ptr<RetryingSender> sender,
                  std::shared_ptr<boost::asio::io_context> context,
                  std::chrono::milliseconds reply_timeout);

    void subscribe(MessageDispatcher &dispatcher);

    /**
     * Asks issuer participant for a credential
     * @param issuer - participant running the issuing authority
     * @param claims - requested claims
     * @param callback - called once with credential or error
     */
    outcome::result<void> requestCredential(const ParticipantId &issuer,
                                            const ClaimSet &claims,
                                            CredentialCallback callback);

    /**
     * Asks holder for its presentation and verifies it
     */
    outcome::result<void> queryPresentation(const ParticipantId &holder,
                                            PresentationCallback callback);

    /**
     * Asks issuer participant whether credential or token is revoked
     */
    outcome::result<void> checkRevocation(const ParticipantId &issuer,
                                          const std::string &credential_id,
                                          RevocationCallback callback);

   private:
    using PendingCallback = boost::variant<CredentialCallback,
                                           PresentationCallback,
                                           RevocationCallback>;

    struct Pending {
      PendingCallback callback;
      std::shared_ptr<boost::asio::steady_timer> deadline;
    };

    outcome::result<void> request(const ParticipantId &counterparty,
                                  Message message,
                                  PendingCallback callback);

    boost::optional<PendingCallback> takePending(
        const boost::optional<std::string> &request_id);

    void reply(const Message &request, Message message);

    void fail(PendingCallback callback, const std::error_code &error) const;

    /// Issues credential to the sender, a present presentation must verify
    void onCredentialRequest(const Message &message);
    void onCredentialOffer(const Message &message);
    void onPresentationQuery(const Message &message);
    void onRevocationCheck(const Message &message);

    /// Fails unanswered request
    void expire(const std::string &request_id);

    std::shared_ptr<ClaimsAuthority> authority_;
    std::shared_ptr<RetryingSender> sender_;
    std::shared_ptr<boost::asio::io_context> context_;
    std::chrono::milliseconds reply_timeout_;

    std::mutex mutex_;
    /// callbacks by request message id
    std::map<std::string, Pending> pending_;

    common::Logger logger_;
  };
}  // namespace ds::protocol
