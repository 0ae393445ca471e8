/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "process/lease.hpp"

#include "process/process_store_error.hpp"

namespace ds::process {

  Lease::Lease(LeaseManager *manager, ProcessId id)
      : manager_{manager}, id_{std::move(id)} {}

  Lease::Lease(Lease &&other) noexcept
      : manager_{other.manager_}, id_{std::move(other.id_)} {
    other.manager_ = nullptr;
  }

  Lease &Lease::operator=(Lease &&other) noexcept {
    if (this != &other) {
      release();
      manager_ = other.manager_;
      id_ = std::move(other.id_);
      other.manager_ = nullptr;
    }
    return *this;
  }

  Lease::~Lease() {
    release();
  }

  const ProcessId &Lease::id() const {
    return id_;
  }

  void Lease::release() {
    if (manager_ != nullptr) {
      manager_->release(id_);
      manager_ = nullptr;
    }
  }

  outcome::result<Lease> LeaseManager::acquire(
      const ProcessId &id, std::chrono::milliseconds wait) {
    const auto self = std::this_thread::get_id();
    std::unique_lock lock{mutex_};
    auto held = leased_.find(id);
    if (held != leased_.end() && held->second == self) {
      return ProcessStoreError::kConcurrentModification;
    }
    if (!released_.wait_for(
            lock, wait, [&] { return leased_.count(id) == 0; })) {
      return ProcessStoreError::kConcurrentModification;
    }
    leased_.emplace(id, self);
    return Lease{this, id};
  }

  outcome::result<Lease> LeaseManager::tryAcquire(const ProcessId &id) {
    std::lock_guard lock{mutex_};
    if (!leased_.emplace(id, std::this_thread::get_id()).second) {
      return ProcessStoreError::kConcurrentModification;
    }
    return Lease{this, id};
  }

  bool LeaseManager::isLeased(const ProcessId &id) const {
    std::lock_guard lock{mutex_};
    return leased_.count(id) != 0;
  }

  void LeaseManager::release(const ProcessId &id) {
    {
      std::lock_guard lock{mutex_};
      leased_.erase(id);
    }
    released_.notify_all();
  }
}  // namespace ds::process
