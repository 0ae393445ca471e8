/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uuid.hpp"

#include <mutex>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace ds::common {
  namespace uuids = boost::uuids;

  std::string generateUuid() {
    // random_generator is not thread safe
    static std::mutex mutex;
    static uuids::random_generator generator;
    std::lock_guard lock{mutex};
    return uuids::to_string(generator());
  }
}  // namespace ds::common
