/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace ds::process {
  using primitives::ProcessId;

  class LeaseManager;

  /**
   * Exclusive right to modify a process, released on destruction
   */
  class Lease {
   public:
    Lease(LeaseManager *manager, ProcessId id);
    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&other) noexcept;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    ~Lease();

    const ProcessId &id() const;

    /// Releases lease before destruction
    void release();

   private:
    LeaseManager *manager_;
    ProcessId id_;
  };

  /**
   * Single writer per process id. Leases must not outlive the manager.
   * Leases are not reentrant: the holder thread asking for the same id again
   * fails at once instead of waiting for itself.
   */
  class LeaseManager {
   public:
    /**
     * Acquires lease, queues behind the current holder
     * @param id - process id
     * @param wait - max time to wait for the current holder
     * @return lease or kConcurrentModification if the process is still leased
     * after wait or is leased by the calling thread
     */
    outcome::result<Lease> acquire(const ProcessId &id,
                                   std::chrono::milliseconds wait);

    /**
     * Acquires lease if the process is not leased
     * @return lease or kConcurrentModification
     */
    outcome::result<Lease> tryAcquire(const ProcessId &id);

    bool isLeased(const ProcessId &id) const;

   private:
    friend class Lease;

    void release(const ProcessId &id);

    mutable std::mutex mutex_;
    std::condition_variable released_;
    /// holder thread by process id
    std::map<ProcessId, std::thread::id> leased_;
  };
}  // namespace ds::process
