/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ds::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using JIn = const Value *;

  outcome::result<Document> parse(std::string_view input);

  outcome::result<Document> parse(const Bytes &input);

  outcome::result<Bytes> format(JIn j);
  outcome::result<Bytes> format(Document &&doc);
}  // namespace ds::codec::json
