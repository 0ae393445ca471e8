/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "storage/face/persistent_map.hpp"

namespace ds::storage {

  using PersistentBufferMap = face::PersistentMap<Bytes, Bytes>;

  using BufferBatch = face::WriteBatch<Bytes, Bytes>;

  using BufferMapCursor = face::MapCursor<Bytes, Bytes>;

}  // namespace ds::storage
