/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/retrying_sender.hpp"

#include <algorithm>

#include "common/uuid.hpp"
#include "protocol/protocol_error.hpp"

namespace ds::protocol {

  RetryingSender::RetryingSender(
      std::shared_ptr<Transport> transport,
      std::shared_ptr<boost::asio::io_context> context,
      std::shared_ptr<Identity> identity,
      RetryConfig config)
      : transport_{std::move(transport)},
        context_{std::move(context)},
        identity_{std::move(identity)},
        config_{config},
        logger_{common::createLogger("retry")} {}

  outcome::result<DeliveryStatus> RetryingSender::send(
      const ParticipantId &counterparty,
      const ProcessId &process_id,
      Message message,
      ExhaustedCallback on_exhausted) {
    if (message.message_id.empty()) {
      message.message_id = common::generateUuid();
    }
    message.sender = identity_->id();
    message.presentation = identity_->presentation();

    auto sent = transport_->send(counterparty, message, config_.send_timeout);
    if (sent) {
      return DeliveryStatus::kDelivered;
    }
    logger_->warn("{} {} to {} failed: {}",
                  toString(message.type),
                  message.message_id,
                  counterparty,
                  sent.error().message());
    if (config_.max_attempts == 0) {
      return ProtocolError::kCounterpartyUnreachable;
    }

    auto pending = std::make_shared<Pending>(
        Pending{counterparty,
                process_id,
                std::move(message),
                std::move(on_exhausted),
                0,
                boost::asio::steady_timer{*context_},
                false});
    std::lock_guard lock{mutex_};
    pending_[process_id].push_back(pending);
    schedule(pending);
    return DeliveryStatus::kQueued;
  }

  void RetryingSender::cancel(const ProcessId &process_id) {
    std::lock_guard lock{mutex_};
    auto it = pending_.find(process_id);
    if (it == pending_.end()) {
      return;
    }
    for (auto &pending : it->second) {
      pending->cancelled = true;
      pending->timer.cancel();
    }
    logger_->debug("Cancelled {} retries of {}", it->second.size(), process_id);
    pending_.erase(it);
  }

  size_t RetryingSender::pending(const ProcessId &process_id) const {
    std::lock_guard lock{mutex_};
    auto it = pending_.find(process_id);
    return it == pending_.end() ? 0 : it->second.size();
  }

  std::chrono::milliseconds RetryingSender::backoff(uint64_t attempt) const {
    auto delay = config_.initial_delay;
    for (uint64_t i = 0; i < attempt && delay < config_.max_delay; ++i) {
      delay *= 2;
    }
    return std::min(delay, config_.max_delay);
  }

  void RetryingSender::schedule(const PendingPtr &pending) {
    pending->timer.expires_after(backoff(pending->attempt));
    pending->timer.async_wait(
        [weak{weak_from_this()}, pending](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          if (auto self = weak.lock()) {
            self->retry(pending);
          }
        });
  }

  void RetryingSender::retry(const PendingPtr &pending) {
    {
      std::lock_guard lock{mutex_};
      if (pending->cancelled) {
        return;
      }
    }
    auto sent = transport_->send(
        pending->counterparty, pending->message, config_.send_timeout);

    std::unique_lock lock{mutex_};
    if (pending->cancelled) {
      return;
    }
    if (sent) {
      logger_->debug("{} {} delivered after {} retries",
                     toString(pending->message.type),
                     pending->message.message_id,
                     pending->attempt + 1);
      erase(pending);
      return;
    }
    ++pending->attempt;
    if (pending->attempt < config_.max_attempts) {
      schedule(pending);
      return;
    }
    logger_->error("{} {} to {} undelivered after {} retries, process {}",
                   toString(pending->message.type),
                   pending->message.message_id,
                   pending->counterparty,
                   pending->attempt,
                   pending->process_id);
    erase(pending);
    lock.unlock();
    if (pending->on_exhausted) {
      pending->on_exhausted(pending->process_id, pending->message);
    }
  }

  void RetryingSender::erase(const PendingPtr &pending) {
    auto it = pending_.find(pending->process_id);
    if (it == pending_.end()) {
      return;
    }
    it->second.remove(pending);
    if (it->second.empty()) {
      pending_.erase(it);
    }
  }
}  // namespace ds::protocol
