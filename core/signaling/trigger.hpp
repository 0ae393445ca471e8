/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <mutex>

#include <boost/variant.hpp>

#include "signaling/types.hpp"

namespace ds::signaling {

  /// Policy monitor detected expired or violated usage policy
  struct PolicyMonitorTrigger {
    ProcessId process_id;
    bool violation{false};
  };

  /// Counterparty suspended or terminated the transfer
  struct RemoteMessageTrigger {
    ProcessId process_id;
    bool suspend{false};
  };

  /// Operator invocation
  struct ManualTrigger {
    ProcessId process_id;
    bool suspend{false};
  };

  /// Unrecoverable local error
  struct SystemErrorTrigger {
    ProcessId process_id;
    std::string detail;
  };

  using Trigger = boost::variant<PolicyMonitorTrigger,
                                 RemoteMessageTrigger,
                                 ManualTrigger,
                                 SystemErrorTrigger>;

  /**
   * Suspend or terminate call a trigger maps to
   */
  struct TriggerDecision {
    ProcessId process_id;
    bool suspend{false};
    TerminationReason reason{TerminationReason::kNone};
  };

  TriggerDecision decide(const Trigger &trigger);

  /**
   * Source of triggers for suspending and terminating flows
   */
  class TriggerSource {
   public:
    using TriggerHandler = std::function<void(const Trigger &)>;

    virtual ~TriggerSource() = default;

    virtual void setHandler(TriggerHandler handler) = 0;
  };

  /**
   * Trigger source fired by caller, used for operator and policy monitor
   * hooks
   */
  class ManualTriggerSource : public TriggerSource {
   public:
    void setHandler(TriggerHandler handler) override;

    /// Passes trigger to the handler, ignored if none is set
    void fire(const Trigger &trigger) const;

   private:
    mutable std::mutex mutex_;
    TriggerHandler handler_;
  };
}  // namespace ds::signaling
