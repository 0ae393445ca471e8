/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "protocol/message_dispatcher.hpp"
#include "signaling/trigger.hpp"
#include "signaling/types.hpp"
#include "transfer/types.hpp"

namespace ds::transfer {
  using signaling::Edr;

  /// Transfer started by the local data plane
  struct StartedTransfer {
    ProcessId process_id;
    /// endpoint reference of a pull transfer
    boost::optional<Edr> edr;
  };

  /**
   * Coordinates transfers with counterparties and keeps the local data flow
   * of provider transfers in lockstep with the transfer state
   */
  class TransferCoordinator {
   public:
    virtual ~TransferCoordinator() = default;

    /// Subscribes to inbound transfer messages
    virtual void subscribe(protocol::MessageDispatcher &dispatcher) = 0;

    /**
     * Provisions and starts transfer on the local data plane
     * @param agreement_id - agreement of a finalized negotiation
     * @param type - push or pull
     * @param address - push destination or pull source
     * @return process id and edr for pull, kContractNotAgreed if the
     * negotiation of the agreement is not finalized
     */
    virtual outcome::result<StartedTransfer> requestTransfer(
        const std::string &agreement_id,
        TransferType type,
        const DataAddress &address) = 0;

    /**
     * Consumer asks provider of the agreement to start transfer
     * @param address - push destination, ignored for pull
     * @return new process id or kContractNotAgreed
     */
    virtual outcome::result<ProcessId> openTransfer(
        const std::string &agreement_id,
        TransferType type,
        const DataAddress &address) = 0;

    virtual outcome::result<void> suspend(const ProcessId &process_id) = 0;

    /**
     * Resumes suspended transfer with a fresh token
     * @return new edr on provider side for pull, none on consumer side where
     * the edr arrives with TransferStart
     */
    virtual outcome::result<boost::optional<Edr>> resume(
        const ProcessId &process_id) = 0;

    /**
     * Ends transfer, kCompleted leads to COMPLETED and other reasons to
     * TERMINATED. Succeeds without side effects on ended transfer.
     */
    virtual outcome::result<void> terminate(const ProcessId &process_id,
                                            TerminationReason reason) = 0;

    /// Terminates with kCompleted
    virtual outcome::result<void> complete(const ProcessId &process_id) = 0;

    /// Maps trigger to suspend or terminate of the transfer
    virtual outcome::result<void> handleTrigger(
        const signaling::Trigger &trigger) = 0;

    virtual outcome::result<TransferProcess> getProcess(
        const ProcessId &process_id) const = 0;

    virtual outcome::result<std::vector<TransferProcess>> listByState(
        TransferState state) const = 0;
  };
}  // namespace ds::transfer
