/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ds {
  using Bytes = std::vector<uint8_t>;

  inline Bytes copy(std::string_view s) {
    return {s.begin(), s.end()};
  }

  inline std::string_view bytestr(const Bytes &bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
  }
}  // namespace ds
