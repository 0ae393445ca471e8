/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "protocol/message_dispatcher.hpp"

namespace ds::protocol {

  MessageDispatcher::MessageDispatcher()
      : logger_{common::createLogger("protocol")} {}

  void MessageDispatcher::attach(Transport &transport) {
    transport.setHandler([weak{weak_from_this()}](
                             const Message &message) -> outcome::result<void> {
      if (auto self = weak.lock()) {
        return self->dispatch(message);
      }
      return outcome::success();
    });
  }

  void MessageDispatcher::subscribe(MessageType type, Handler handler) {
    std::lock_guard lock{mutex_};
    handlers_[type] = std::move(handler);
  }

  outcome::result<void> MessageDispatcher::dispatch(
      const Message &message) const {
    Handler handler;
    {
      std::lock_guard lock{mutex_};
      auto it = handlers_.find(message.type);
      if (it != handlers_.end()) {
        handler = it->second;
      }
    }
    if (!handler) {
      logger_->warn("No handler for {} {} from {}",
                    toString(message.type),
                    message.message_id,
                    message.sender);
      return outcome::success();
    }
    return handler(message);
  }
}  // namespace ds::protocol
