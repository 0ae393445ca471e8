/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "codec/json/coding.hpp"
#include "primitives/types.hpp"
#include "process/process_store_error.hpp"
#include "storage/buffer_map.hpp"

namespace ds::process {
  using primitives::ProcessId;
  using storage::PersistentBufferMap;

  /**
   * Durable record of processes of one kind.
   *
   * Records are json documents stored under "/<prefix>/<id>", secondary keys
   * under "/<prefix>/alias/<alias>". Record type has to provide `id` and
   * `state` members and json codec.
   * @tparam Record - process record type
   */
  template <typename Record>
  class ProcessStore {
   public:
    using State = decltype(Record::state);

    ProcessStore(std::shared_ptr<PersistentBufferMap> storage,
                 const std::string &prefix)
        : storage_{std::move(storage)},
          prefix_{"/" + prefix + "/"},
          alias_prefix_{prefix_ + "alias/"} {}

    /**
     * Creates or overwrites record
     */
    outcome::result<void> save(const Record &record) {
      OUTCOME_TRY(encoded, codec::json::encodeDocument(record));
      std::lock_guard lock{mutex_};
      return storage_->put(recordKey(record.id), encoded);
    }

    /**
     * Loads record
     * @return record or kNotFound
     */
    outcome::result<Record> load(const ProcessId &id) const {
      Bytes encoded;
      {
        std::lock_guard lock{mutex_};
        auto key = recordKey(id);
        if (!storage_->contains(key)) {
          return ProcessStoreError::kNotFound;
        }
        OUTCOME_TRYA(encoded, storage_->get(key));
      }
      return codec::json::decodeDocument<Record>(encoded);
    }

    bool contains(const ProcessId &id) const {
      std::lock_guard lock{mutex_};
      return storage_->contains(recordKey(id));
    }

    /**
     * All records of the store ordered by id
     */
    outcome::result<std::vector<Record>> list() const {
      std::vector<Bytes> encoded;
      {
        std::lock_guard lock{mutex_};
        auto cursor = storage_->cursor();
        const auto prefix = copy(prefix_);
        const auto alias_prefix = copy(alias_prefix_);
        for (cursor->seek(prefix); cursor->isValid(); cursor->next()) {
          auto key = cursor->key();
          if (!startsWith(key, prefix)) {
            break;
          }
          if (startsWith(key, alias_prefix)) {
            continue;
          }
          encoded.push_back(cursor->value());
        }
      }
      std::vector<Record> records;
      records.reserve(encoded.size());
      for (const auto &bytes : encoded) {
        OUTCOME_TRY(record, codec::json::decodeDocument<Record>(bytes));
        records.push_back(std::move(record));
      }
      return records;
    }

    outcome::result<std::vector<Record>> listByState(State state) const {
      OUTCOME_TRY(records, list());
      std::vector<Record> result;
      for (auto &record : records) {
        if (record.state == state) {
          result.push_back(std::move(record));
        }
      }
      return result;
    }

    /**
     * Binds secondary key to a process id
     */
    outcome::result<void> link(const std::string &alias, const ProcessId &id) {
      std::lock_guard lock{mutex_};
      return storage_->put(aliasKey(alias), copy(id));
    }

    /**
     * Finds process id by secondary key
     * @return process id or kNotFound
     */
    outcome::result<ProcessId> resolve(const std::string &alias) const {
      std::lock_guard lock{mutex_};
      auto key = aliasKey(alias);
      if (!storage_->contains(key)) {
        return ProcessStoreError::kNotFound;
      }
      OUTCOME_TRY(id, storage_->get(key));
      return std::string{bytestr(id)};
    }

   private:
    Bytes recordKey(const ProcessId &id) const {
      return copy(prefix_ + id);
    }

    Bytes aliasKey(const std::string &alias) const {
      return copy(alias_prefix_ + alias);
    }

    static bool startsWith(const Bytes &key, const Bytes &prefix) {
      return key.size() >= prefix.size()
             && std::equal(prefix.begin(), prefix.end(), key.begin());
    }

    std::shared_ptr<PersistentBufferMap> storage_;
    std::string prefix_;
    std::string alias_prefix_;
    mutable std::mutex mutex_;
  };
}  // namespace ds::process
