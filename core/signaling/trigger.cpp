/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signaling/trigger.hpp"

namespace ds::signaling {
  namespace {
    struct Decide : boost::static_visitor<TriggerDecision> {
      TriggerDecision operator()(const PolicyMonitorTrigger &trigger) const {
        return {trigger.process_id,
                false,
                trigger.violation ? TerminationReason::kPolicyViolation
                                  : TerminationReason::kTimeout};
      }

      TriggerDecision operator()(const RemoteMessageTrigger &trigger) const {
        return {trigger.process_id,
                trigger.suspend,
                trigger.suspend ? TerminationReason::kNone
                                : TerminationReason::kCounterpartyAbort};
      }

      TriggerDecision operator()(const ManualTrigger &trigger) const {
        return {trigger.process_id,
                trigger.suspend,
                trigger.suspend ? TerminationReason::kNone
                                : TerminationReason::kManual};
      }

      TriggerDecision operator()(const SystemErrorTrigger &trigger) const {
        return {trigger.process_id, false, TerminationReason::kSystemError};
      }
    };
  }  // namespace

  TriggerDecision decide(const Trigger &trigger) {
    return boost::apply_visitor(Decide{}, trigger);
  }

  void ManualTriggerSource::setHandler(TriggerHandler handler) {
    std::lock_guard lock{mutex_};
    handler_ = std::move(handler);
  }

  void ManualTriggerSource::fire(const Trigger &trigger) const {
    TriggerHandler handler;
    {
      std::lock_guard lock{mutex_};
      handler = handler_;
    }
    if (handler) {
      handler(trigger);
    }
  }
}  // namespace ds::signaling
