/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "signaling/types.hpp"

namespace ds::signaling {

  /**
   * Data plane moving or serving the bytes of a flow
   */
  class DataPlane {
   public:
    virtual ~DataPlane() = default;

    /**
     * Prepares data movement
     * @param process_id - flow id
     * @param type - push sends to address, pull serves data from address
     * @param address - push destination or pull source
     * @param token - token authorizing the flow
     * @return endpoint consumer fetches pull data from, address for push
     */
    virtual outcome::result<DataAddress> provision(const ProcessId &process_id,
                                                   TransferType type,
                                                   const DataAddress &address,
                                                   const std::string &token) = 0;

    /// Halts data movement, keeps provisioned resources
    virtual outcome::result<void> pause(const ProcessId &process_id) = 0;

    /// Continues paused flow authorized by new token
    virtual outcome::result<void> resume(const ProcessId &process_id,
                                         const std::string &token) = 0;

    /// Releases provisioned resources
    virtual outcome::result<void> teardown(const ProcessId &process_id) = 0;
  };
}  // namespace ds::signaling
