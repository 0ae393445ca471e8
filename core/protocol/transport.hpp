/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>

#include "common/outcome.hpp"
#include "protocol/message.hpp"

namespace ds::protocol {

  /**
   * Authenticated channel to counterparties
   */
  class Transport {
   public:
    /// Returns acknowledgement of the inbound message, an error leaves it to
    /// redelivery by the sender
    using MessageHandler =
        std::function<outcome::result<void>(const Message &)>;

    virtual ~Transport() = default;

    /**
     * Delivers message to counterparty
     * @param counterparty - receiver participant
     * @param message - message to deliver
     * @param timeout - bound for the call
     * @return acknowledgement or kDeliveryFailed
     */
    virtual outcome::result<void> send(const ParticipantId &counterparty,
                                       const Message &message,
                                       std::chrono::milliseconds timeout) = 0;

    /// Sets inbound message callback
    virtual void setHandler(MessageHandler handler) = 0;
  };
}  // namespace ds::protocol
