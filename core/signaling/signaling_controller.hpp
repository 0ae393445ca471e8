/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "signaling/trigger.hpp"
#include "signaling/types.hpp"

namespace ds::signaling {

  /**
   * Drives data flows of the local data plane
   */
  class SignalingController {
   public:
    virtual ~SignalingController() = default;

    /**
     * Starts new flow or resumes suspended one with a fresh token. Starting
     * started flow with the same parameters returns its current reference.
     * @param process_id - transfer process id
     * @param type - push or pull
     * @param address - push destination or pull source
     * @return edr for pull, none for push. kParametersMismatch if existing
     * flow has different parameters, kInvalidStateTransition if terminated
     */
    virtual outcome::result<boost::optional<Edr>> start(
        const ProcessId &process_id,
        TransferType type,
        const DataAddress &address) = 0;

    /// Start of existing flow with its own parameters
    virtual outcome::result<boost::optional<Edr>> resume(
        const ProcessId &process_id) = 0;

    /**
     * Pauses started flow and revokes its token
     * @return kInvalidStateTransition unless flow is started
     */
    virtual outcome::result<void> suspend(const ProcessId &process_id) = 0;

    /**
     * Revokes token and releases data plane resources, succeeds without side
     * effects on terminated flow
     * @return kInvalidStateTransition if flow is absent
     */
    virtual outcome::result<void> terminate(const ProcessId &process_id,
                                            TerminationReason reason) = 0;

    /// Maps trigger to suspend or terminate
    virtual outcome::result<void> handleTrigger(const Trigger &trigger) = 0;

    virtual outcome::result<DataFlow> getFlow(
        const ProcessId &process_id) const = 0;
  };
}  // namespace ds::signaling
