/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/claims_service.hpp"

#include "claims/claims_error.hpp"
#include "common/uuid.hpp"
#include "protocol/protocol_error.hpp"

namespace ds::protocol {
  using claims::Presentation;

  ClaimsService::ClaimsService(
      std::shared_ptr<ClaimsAuthority> authority,
      std::shared_ptr<RetryingSender> sender,
      std::shared_ptr<boost::asio::io_context> context,
      std::chrono::milliseconds reply_timeout)
      : authority_{std::move(authority)},
        sender_{std::move(sender)},
        context_{std::move(context)},
        reply_timeout_{reply_timeout},
        logger_{common::createLogger("claims")} {}

  void ClaimsService::subscribe(MessageDispatcher &dispatcher) {
    auto bind = [weak{weak_from_this()}](auto method) {
      return [weak, method](
                 const Message &message) -> outcome::result<void> {
        if (auto self = weak.lock()) {
          ((*self).*method)(message);
        }
        return outcome::success();
      };
    };
    dispatcher.subscribe(MessageType::kCredentialRequest,
                         bind(&ClaimsService::onCredentialRequest));
    dispatcher.subscribe(MessageType::kCredentialOffer,
                         bind(&ClaimsService::onCredentialOffer));
    dispatcher.subscribe(MessageType::kPresentationQuery,
                         bind(&ClaimsService::onPresentationQuery));
    dispatcher.subscribe(MessageType::kRevocationCheck,
                         bind(&ClaimsService::onRevocationCheck));
  }

  outcome::result<void> ClaimsService::requestCredential(
      const ParticipantId &issuer,
      const ClaimSet &claims,
      CredentialCallback callback) {
    Message message;
    message.type = MessageType::kCredentialRequest;
    message.claims = claims;
    return request(issuer, std::move(message), std::move(callback));
  }

  outcome::result<void> ClaimsService::queryPresentation(
      const ParticipantId &holder, PresentationCallback callback) {
    Message message;
    message.type = MessageType::kPresentationQuery;
    return request(holder, std::move(message), std::move(callback));
  }

  outcome::result<void> ClaimsService::checkRevocation(
      const ParticipantId &issuer,
      const std::string &credential_id,
      RevocationCallback callback) {
    Message message;
    message.type = MessageType::kRevocationCheck;
    message.credential_id = credential_id;
    return request(issuer, std::move(message), std::move(callback));
  }

  outcome::result<void> ClaimsService::request(const ParticipantId &counterparty,
                                               Message message,
                                               PendingCallback callback) {
    message.message_id = common::generateUuid();
    const auto request_id = message.message_id;
    auto deadline = std::make_shared<boost::asio::steady_timer>(*context_);
    {
      std::lock_guard lock{mutex_};
      pending_.emplace(request_id, Pending{std::move(callback), deadline});
      deadline->expires_after(reply_timeout_);
      deadline->async_wait([weak{weak_from_this()}, request_id](
                               const boost::system::error_code &ec) {
        if (ec) {
          return;
        }
        if (auto self = weak.lock()) {
          self->expire(request_id);
        }
      });
    }
    auto sent = sender_->send(
        counterparty,
        request_id,
        std::move(message),
        [weak{weak_from_this()}](auto &, const Message &message) {
          if (auto self = weak.lock()) {
            if (auto pending = self->takePending(message.message_id)) {
              self->fail(*pending, ProtocolError::kCounterpartyUnreachable);
            }
          }
        });
    if (!sent) {
      std::lock_guard lock{mutex_};
      pending_.erase(request_id);
      deadline->cancel();
      return sent.error();
    }
    return outcome::success();
  }

  void ClaimsService::expire(const std::string &request_id) {
    auto pending = takePending(request_id);
    if (!pending) {
      return;
    }
    logger_->warn("Request {} unanswered after {} ms",
                  request_id,
                  reply_timeout_.count());
    fail(*pending, ProtocolError::kCounterpartyUnreachable);
  }

  boost::optional<ClaimsService::PendingCallback> ClaimsService::takePending(
      const boost::optional<std::string> &request_id) {
    if (!request_id) {
      return boost::none;
    }
    std::lock_guard lock{mutex_};
    auto it = pending_.find(*request_id);
    if (it == pending_.end()) {
      return boost::none;
    }
    auto pending = std::move(it->second);
    pending_.erase(it);
    pending.deadline->cancel();
    return std::move(pending.callback);
  }

  void ClaimsService::reply(const Message &request, Message message) {
    message.in_reply_to = request.message_id;
    auto sent = sender_->send(
        request.sender, request.message_id, std::move(message), {});
    if (!sent) {
      logger_->error("Reply to {} from {} failed: {}",
                     toString(request.type),
                     request.sender,
                     sent.error().message());
    }
  }

  void ClaimsService::fail(PendingCallback callback,
                           const std::error_code &error) const {
    if (auto *cb = boost::get<CredentialCallback>(&callback)) {
      (*cb)(error);
    } else if (auto *cb = boost::get<PresentationCallback>(&callback)) {
      (*cb)(error);
    } else if (auto *cb = boost::get<RevocationCallback>(&callback)) {
      (*cb)(error);
    }
  }

  void ClaimsService::onCredentialRequest(const Message &message) {
    Message offer;
    offer.type = MessageType::kCredentialOffer;
    // a participant onboarding without any credential sends no presentation,
    // the attestation source alone decides on its claims
    if (!message.presentation.empty()) {
      auto presented = authority_->verifyPresentation(
          Presentation{message.sender, message.presentation});
      if (!presented) {
        logger_->warn("CredentialRequest {} from {} not verified: {}",
                      message.message_id,
                      message.sender,
                      presented.error().message());
        offer.detail = presented.error().message();
        reply(message, std::move(offer));
        return;
      }
    }
    auto credential = authority_->issueCredential(
        message.sender, message.claims.value_or(ClaimSet{}));
    if (credential) {
      offer.credential = credential.value().signature;
      offer.credential_id = credential.value().id;
    } else {
      offer.detail = credential.error().message();
    }
    reply(message, std::move(offer));
  }

  void ClaimsService::onCredentialOffer(const Message &message) {
    auto pending = takePending(message.in_reply_to);
    if (!pending) {
      logger_->warn("Unsolicited credential offer {} from {}",
                    message.message_id,
                    message.sender);
      return;
    }
    auto *callback = boost::get<CredentialCallback>(&*pending);
    if (callback == nullptr) {
      return;
    }
    if (!message.credential) {
      logger_->warn("Credential denied by {}: {}",
                    message.sender,
                    message.detail.value_or(""));
      (*callback)(claims::ClaimsError::kIssuanceDenied);
      return;
    }
    (*callback)(*message.credential);
  }

  void ClaimsService::onPresentationQuery(const Message &message) {
    if (!message.in_reply_to) {
      Message response;
      response.type = MessageType::kPresentationQuery;
      reply(message, std::move(response));
      return;
    }
    auto pending = takePending(message.in_reply_to);
    if (!pending) {
      return;
    }
    if (auto *callback = boost::get<PresentationCallback>(&*pending)) {
      (*callback)(authority_->verifyPresentation(
          Presentation{message.sender, message.presentation}));
    }
  }

  void ClaimsService::onRevocationCheck(const Message &message) {
    if (!message.in_reply_to) {
      if (!message.credential_id) {
        logger_->warn("Revocation check {} without credential id",
                      message.message_id);
        return;
      }
      Message response;
      response.type = MessageType::kRevocationCheck;
      response.credential_id = message.credential_id;
      auto revoked = authority_->checkRevocation(*message.credential_id);
      if (revoked) {
        response.revoked = revoked.value();
      } else {
        response.detail = revoked.error().message();
      }
      reply(message, std::move(response));
      return;
    }
    auto pending = takePending(message.in_reply_to);
    if (!pending) {
      return;
    }
    if (auto *callback = boost::get<RevocationCallback>(&*pending)) {
      if (!message.revoked) {
        (*callback)(ProtocolError::kMalformedMessage);
        return;
      }
      (*callback)(*message.revoked);
    }
  }
}  // namespace ds::protocol
