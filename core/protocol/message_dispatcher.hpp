/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "common/logger.hpp"
#include "protocol/transport.hpp"

namespace ds::protocol {

  /**
   * Routes inbound messages to handlers by message type
   */
  class MessageDispatcher
      : public std::enable_shared_from_this<MessageDispatcher> {
   public:
    using Handler = Transport::MessageHandler;

    MessageDispatcher();

    /// Registers itself as inbound handler of the transport
    void attach(Transport &transport);

    /// Sets handler for message type, replaces previous one
    void subscribe(MessageType type, Handler handler);

    /**
     * Calls handler of the message type
     * @return handler result, success for a type without handler
     */
    outcome::result<void> dispatch(const Message &message) const;

   private:
    mutable std::mutex mutex_;
    std::map<MessageType, Handler> handlers_;
    common::Logger logger_;
  };
}  // namespace ds::protocol
