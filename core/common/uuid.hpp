/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace ds::common {
  /// Random (v4) uuid in canonical textual form
  std::string generateUuid();
}  // namespace ds::common
