/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <boost/optional.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "codec/json/json_errors.hpp"
#include "common/outcome.hpp"

#define COMMA ,

#define JSON_ENCODE(type)               \
  inline ::ds::codec::json::Value encode( \
      const type &v, rapidjson::MemoryPoolAllocator<> &allocator)

// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define JSON_DECODE(type) \
  inline void decode(type &v, const ::ds::codec::json::Value &j)

namespace ds::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;

  template <typename T>
  T innerDecode(const Value &j);

  template <typename T>
  void Set(Value &j,
           std::string_view key,
           const T &v,
           rapidjson::MemoryPoolAllocator<> &allocator);

  inline std::string AsString(const Value &j) {
    if (!j.IsString()) {
      outcome::raise(JsonError::kWrongType);
    }
    return {j.GetString(), j.GetStringLength()};
  }

  JSON_ENCODE(int64_t) {
    return Value{v};
  }

  JSON_DECODE(int64_t) {
    if (j.IsInt64()) {
      v = j.GetInt64();
    } else if (j.IsString()) {
      v = strtoll(j.GetString(), nullptr, 10);
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(uint64_t) {
    return Value{v};
  }

  JSON_DECODE(uint64_t) {
    if (j.IsUint64()) {
      v = j.GetUint64();
    } else if (j.IsString()) {
      v = strtoull(j.GetString(), nullptr, 10);
    } else {
      outcome::raise(JsonError::kWrongType);
    }
  }

  JSON_ENCODE(bool) {
    return Value{v};
  }

  JSON_DECODE(bool) {
    if (!j.IsBool()) {
      outcome::raise(JsonError::kWrongType);
    }
    v = j.GetBool();
  }

  JSON_ENCODE(std::string_view) {
    return {v.data(), static_cast<rapidjson::SizeType>(v.size()), allocator};
  }

  JSON_DECODE(std::string) {
    v = AsString(j);
  }

  template <typename T>
  JSON_ENCODE(std::vector<T>) {
    Value j{rapidjson::kArrayType};
    j.Reserve(v.size(), allocator);
    for (const auto &elem : v) {
      j.PushBack(encode(elem, allocator), allocator);
    }
    return j;
  }

  template <typename T>
  JSON_DECODE(std::vector<T>) {
    if (j.IsNull()) {
      return;
    }
    if (!j.IsArray()) {
      outcome::raise(JsonError::kWrongType);
    }
    v.reserve(j.Size());

    for (const auto &it : j.GetArray()) {
      v.emplace_back(innerDecode<T>(it));
    }
  }

  template <typename T>
  JSON_ENCODE(std::map<std::string COMMA T>) {
    Value j{rapidjson::kObjectType};
    j.MemberReserve(v.size(), allocator);
    for (const auto &pair : v) {
      Set(j, pair.first, pair.second, allocator);
    }
    return j;
  }

  template <typename T>
  JSON_DECODE(std::map<std::string COMMA T>) {
    if (j.IsNull()) {
      return;
    }
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    for (auto it = j.MemberBegin(); it != j.MemberEnd(); ++it) {
      v.emplace(AsString(it->name), innerDecode<T>(it->value));
    }
  }

  template <typename T>
  JSON_ENCODE(boost::optional<T>) {
    if (v) {
      return encode(*v, allocator);
    }
    return {};
  }

  template <typename T>
  JSON_DECODE(boost::optional<T>) {
    if (!j.IsNull()) {
      v = innerDecode<T>(j);
    }
  }

  template <typename T>
  JSON_ENCODE(std::set<T>) {
    Value j{rapidjson::kArrayType};
    j.Reserve(v.size(), allocator);
    for (auto &elem : v) {
      j.PushBack(encode(elem, allocator), allocator);
    }
    return j;
  }

  template <typename T>
  JSON_DECODE(std::set<T>) {
    if (j.IsNull()) {
      return;
    }
    if (!j.IsArray()) {
      outcome::raise(JsonError::kWrongType);
    }
    for (const auto &it : j.GetArray()) {
      v.emplace(innerDecode<T>(it));
    }
  }
}  // namespace ds::codec::json
