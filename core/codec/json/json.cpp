/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "codec/json/json_errors.hpp"

namespace ds::codec::json {
  using rapidjson::ParseFlag;
  using rapidjson::StringBuffer;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse<ParseFlag::kParseNumbersAsStringsFlag>(input.data(),
                                                     input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<Document> parse(const Bytes &input) {
    return parse(bytestr(input));
  }

  outcome::result<Bytes> format(JIn j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    if (j->Accept(writer)) {
      std::string_view s{buffer.GetString(), buffer.GetSize()};
      return Bytes(s.begin(), s.end());
    }
    return JsonError::kFormatError;
  }

  outcome::result<Bytes> format(Document &&doc) {
    return format(&doc);
  }
}  // namespace ds::codec::json
