/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/outcome.hpp"

namespace ds::storage::face {

  /**
   * Forward cursor over bindings ordered by key, used to scan key prefixes
   */
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /// Moves to the key or to the first key greater than it
    virtual void seek(const K &key) = 0;

    virtual bool isValid() const = 0;

    virtual void next() = 0;

    virtual K key() const = 0;

    virtual V value() const = 0;
  };

  /**
   * Writes applied together on commit, none of them before
   */
  template <typename K, typename V>
  struct WriteBatch {
    virtual ~WriteBatch() = default;

    virtual outcome::result<void> put(const K &key, const V &value) = 0;

    virtual outcome::result<void> remove(const K &key) = 0;

    virtual outcome::result<void> commit() = 0;
  };

  /**
   * Durable key-value map backing process records and claims. A successful
   * put or commit is durable and visible to subsequent reads of the key.
   */
  template <typename K, typename V>
  struct PersistentMap {
    virtual ~PersistentMap() = default;

    /// @return value or kNotFound
    virtual outcome::result<V> get(const K &key) const = 0;

    virtual bool contains(const K &key) const = 0;

    virtual outcome::result<void> put(const K &key, const V &value) = 0;

    /// Removing absent key succeeds
    virtual outcome::result<void> remove(const K &key) = 0;

    virtual std::unique_ptr<WriteBatch<K, V>> batch() = 0;

    virtual std::unique_ptr<MapCursor<K, V>> cursor() = 0;
  };

}  // namespace ds::storage::face
