/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/in_memory/in_memory_cursor.hpp"
#include "storage/storage_error.hpp"

namespace ds::storage {

  outcome::result<Bytes> InMemoryStorage::get(const Bytes &key) const {
    std::shared_lock lock{mutex_};
    auto it = storage_.find(key);
    if (it != storage_.end()) {
      return it->second;
    }
    return StorageError::kNotFound;
  }

  outcome::result<void> InMemoryStorage::put(const Bytes &key,
                                             const Bytes &value) {
    std::unique_lock lock{mutex_};
    storage_[key] = value;
    return outcome::success();
  }

  bool InMemoryStorage::contains(const Bytes &key) const {
    std::shared_lock lock{mutex_};
    return storage_.find(key) != storage_.end();
  }

  outcome::result<void> InMemoryStorage::remove(const Bytes &key) {
    std::unique_lock lock{mutex_};
    storage_.erase(key);
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  std::unique_ptr<BufferMapCursor> InMemoryStorage::cursor() {
    std::shared_lock lock{mutex_};
    return std::make_unique<InMemoryCursor>(storage_);
  }
}  // namespace ds::storage
