/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <list>
#include <map>
#include <memory>
#include <mutex>

#include "common/logger.hpp"
#include "config/engine_config.hpp"
#include "protocol/identity.hpp"
#include "protocol/transport.hpp"

namespace ds::protocol {
  using config::RetryConfig;

  enum class DeliveryStatus {
    /// counterparty acknowledged the message
    kDelivered,
    /// first attempt failed, message is queued for retries
    kQueued,
  };

  /**
   * Sends messages on behalf of processes, stamps sender header fields and
   * retries failed deliveries with exponential backoff on io_context timers.
   */
  class RetryingSender : public std::enable_shared_from_this<RetryingSender> {
   public:
    /// Called on io_context when retries of a message are exhausted
    using ExhaustedCallback =
        std::function<void(const ProcessId &, const Message &)>;

    RetryingSender(std::shared_ptr<Transport> transport,
                   std::shared_ptr<boost::asio::io_context> context,
                   std::shared_ptr<Identity> identity,
                   RetryConfig config);

    /**
     * Sends message, first attempt is synchronous
     * @param counterparty - receiver
     * @param process_id - process the message belongs to, cancellation key
     * @param message - message, id is generated if empty
     * @param on_exhausted - called if all retries failed
     * @return kDelivered, kQueued or kCounterpartyUnreachable if the first
     * attempt failed and no retries are configured
     */
    outcome::result<DeliveryStatus> send(const ParticipantId &counterparty,
                                         const ProcessId &process_id,
                                         Message message,
                                         ExhaustedCallback on_exhausted);

    /// Abandons pending retries of the process
    void cancel(const ProcessId &process_id);

    /// Number of messages waiting for retry
    size_t pending(const ProcessId &process_id) const;

    /// Delay before retry attempt, min(initial * 2^attempt, max)
    std::chrono::milliseconds backoff(uint64_t attempt) const;

   private:
    struct Pending {
      ParticipantId counterparty;
      ProcessId process_id;
      Message message;
      ExhaustedCallback on_exhausted;
      uint64_t attempt{};
      boost::asio::steady_timer timer;
      bool cancelled{false};
    };
    using PendingPtr = std::shared_ptr<Pending>;

    /// Must be called with mutex_ locked
    void schedule(const PendingPtr &pending);

    void retry(const PendingPtr &pending);

    void erase(const PendingPtr &pending);

    std::shared_ptr<Transport> transport_;
    std::shared_ptr<boost::asio::io_context> context_;
    std::shared_ptr<Identity> identity_;
    RetryConfig config_;

    mutable std::mutex mutex_;
    std::map<ProcessId, std::list<PendingPtr>> pending_;

    common::Logger logger_;
  };
}  // namespace ds::protocol
