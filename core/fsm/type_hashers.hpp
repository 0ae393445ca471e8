/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_DATASPACE_CORE_FSM_TYPE_HASHERS_HPP
#define CPP_DATASPACE_CORE_FSM_TYPE_HASHERS_HPP

#include <cstddef>

namespace ds::common {

  /// Enables use of enum class values as keys in std::unordered_map
  struct EnumClassHash {
    template <typename T>
    std::size_t operator()(T t) const {
      return static_cast<std::size_t>(t);
    }
  };

}  // namespace ds::common

#endif  // CPP_DATASPACE_CORE_FSM_TYPE_HASHERS_HPP
