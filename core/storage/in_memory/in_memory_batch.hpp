/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace ds::storage {

  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db{db} {}

    outcome::result<void> put(const Bytes &key, const Bytes &value) override {
      entries[key] = value;
      return outcome::success();
    }

    outcome::result<void> remove(const Bytes &key) override {
      entries[key] = boost::none;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      std::unique_lock lock{db.mutex_};
      for (auto &[key, value] : entries) {
        if (value) {
          db.storage_[key] = std::move(*value);
        } else {
          db.storage_.erase(key);
        }
      }
      entries.clear();
      return outcome::success();
    }

   private:
    /// none marks removal
    std::map<Bytes, boost::optional<Bytes>> entries;
    InMemoryStorage &db;
  };
}  // namespace ds::storage
