/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "negotiation/types.hpp"
#include "protocol/message_dispatcher.hpp"

namespace ds::negotiation {

  /**
   * Contract negotiation of a participant in both consumer and provider role
   */
  class NegotiationEngine {
   public:
    virtual ~NegotiationEngine() = default;

    /// Subscribes to inbound negotiation messages
    virtual void subscribe(protocol::MessageDispatcher &dispatcher) = 0;

    /**
     * Starts negotiation as consumer
     * @param provider - participant offering the asset
     * @param offer - proposed terms
     * @return new process id
     */
    virtual outcome::result<ProcessId> requestContract(
        const ParticipantId &provider, const ContractOffer &offer) = 0;

    /**
     * Consumer accepts the last offer of provider and signs agreement
     */
    virtual outcome::result<void> acceptOffer(const ProcessId &process_id) = 0;

    /**
     * Proposes other terms, process stays or returns to offered
     * @return kOfferLimitExceeded if the process was terminated because of
     * too many offers
     */
    virtual outcome::result<void> counterOffer(const ProcessId &process_id,
                                               const ContractOffer &offer) = 0;

    /// Declines the last offer, negotiation may continue with counter offer
    virtual outcome::result<void> decline(const ProcessId &process_id) = 0;

    /// Provider countersigns accepted agreement
    virtual outcome::result<void> agree(const ProcessId &process_id) = 0;

    /// Aborts not finalized negotiation
    virtual outcome::result<void> terminate(const ProcessId &process_id,
                                            TerminationReason reason) = 0;

    virtual outcome::result<NegotiationProcess> getProcess(
        const ProcessId &process_id) const = 0;

    /// Finds negotiation by id of its agreement
    virtual outcome::result<NegotiationProcess> findByAgreement(
        const std::string &agreement_id) const = 0;

    virtual outcome::result<std::vector<NegotiationProcess>> listByState(
        NegotiationState state) const = 0;

    /**
     * Terminates negotiations idle for longer than configured timeout
     * @return number of terminated processes
     */
    virtual outcome::result<size_t> terminateStale() = 0;
  };
}  // namespace ds::negotiation
