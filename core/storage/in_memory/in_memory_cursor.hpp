/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "storage/buffer_map.hpp"

namespace ds::storage {

  /// Cursor over a snapshot of the storage
  class InMemoryCursor : public BufferMapCursor {
   public:
    explicit InMemoryCursor(std::map<Bytes, Bytes> snapshot)
        : snapshot_(std::move(snapshot)) {
      current_iterator_ = snapshot_.end();
    }

    void seek(const Bytes &key) override {
      current_iterator_ = snapshot_.lower_bound(key);
    }

    bool isValid() const override {
      return current_iterator_ != snapshot_.end();
    }

    void next() override {
      if (isValid()) {
        ++current_iterator_;
      }
    }

    Bytes key() const override {
      return current_iterator_->first;
    }

    Bytes value() const override {
      return current_iterator_->second;
    }

   private:
    std::map<Bytes, Bytes> snapshot_;
    std::map<Bytes, Bytes>::const_iterator current_iterator_;
  };

}  // namespace ds::storage
