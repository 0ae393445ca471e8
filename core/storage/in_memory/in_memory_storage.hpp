/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include "common/outcome.hpp"
#include "storage/buffer_map.hpp"

namespace ds::storage {
  /**
   * Simple thread safe storage that conforms PersistentMap interface.
   * Used as process and claims backing in tests and single process
   * deployments.
   */
  class InMemoryStorage : public PersistentBufferMap,
                          public std::enable_shared_from_this<InMemoryStorage> {
   public:
    ~InMemoryStorage() override = default;

    outcome::result<Bytes> get(const Bytes &key) const override;

    outcome::result<void> put(const Bytes &key, const Bytes &value) override;

    bool contains(const Bytes &key) const override;

    outcome::result<void> remove(const Bytes &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    /// Cursor iterates over a snapshot taken at creation
    std::unique_ptr<BufferMapCursor> cursor() override;

   private:
    friend class InMemoryBatch;
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> storage_;
  };

}  // namespace ds::storage
