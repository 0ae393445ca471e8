/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <string>

#include "primitives/types.hpp"

namespace ds::protocol {
  using primitives::ParticipantId;

  /**
   * Own participant id and presentation attached to outbound messages
   */
  class Identity {
   public:
    explicit Identity(ParticipantId id) : id_{std::move(id)} {}

    const ParticipantId &id() const {
      return id_;
    }

    std::string presentation() const {
      std::lock_guard lock{mutex_};
      return presentation_;
    }

    void setPresentation(std::string presentation) {
      std::lock_guard lock{mutex_};
      presentation_ = std::move(presentation);
    }

   private:
    const ParticipantId id_;
    mutable std::mutex mutex_;
    std::string presentation_;
  };
}  // namespace ds::protocol
