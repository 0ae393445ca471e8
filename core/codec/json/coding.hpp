/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "codec/json/basic_coding.hpp"
#include "codec/json/json.hpp"

namespace ds::codec::json {

  inline void Set(Value &j,
                  std::string_view key,
                  Value &&value,
                  rapidjson::MemoryPoolAllocator<> &allocator) {
    j.AddMember(encode(key, allocator), value, allocator);
  }

  template <typename T>
  inline void Set(Value &j,
                  std::string_view key,
                  const T &v,
                  rapidjson::MemoryPoolAllocator<> &allocator) {
    Set(j, key, encode(v, allocator), allocator);
  }

  /// Enums are stored as their underlying integer
  template <typename T>
  inline void SetEnum(Value &j,
                      std::string_view key,
                      T v,
                      rapidjson::MemoryPoolAllocator<> &allocator) {
    static_assert(std::is_enum_v<T>);
    Set(j, key, static_cast<uint64_t>(v), allocator);
  }

  /// Durations are stored as count of their own period
  template <typename Rep, typename Period>
  inline void SetDuration(Value &j,
                          std::string_view key,
                          std::chrono::duration<Rep, Period> v,
                          rapidjson::MemoryPoolAllocator<> &allocator) {
    Set(j, key, static_cast<int64_t>(v.count()), allocator);
  }

  inline const Value &Get(const Value &j, const char *key) {
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    auto it = j.FindMember(key);
    if (it == j.MemberEnd()) {
      outcome::raise(JsonError::kOutOfRange);
    }
    return it->value;
  }

  template <typename T>
  inline void Get(const Value &j, const char *key, T &v) {
    decode(v, Get(j, key));
  }

  /// Reads member if present, leaves v untouched otherwise
  template <typename T>
  inline void GetOptional(const Value &j, const char *key, T &v) {
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    auto it = j.FindMember(key);
    if (it != j.MemberEnd()) {
      decode(v, it->value);
    }
  }

  template <typename T>
  inline void GetEnum(const Value &j, const char *key, T &v, T max) {
    static_assert(std::is_enum_v<T>);
    auto raw = innerDecode<uint64_t>(Get(j, key));
    if (raw > static_cast<uint64_t>(max)) {
      outcome::raise(JsonError::kWrongEnum);
    }
    v = static_cast<T>(raw);
  }

  template <typename Rep, typename Period>
  inline void GetDuration(const Value &j,
                          const char *key,
                          std::chrono::duration<Rep, Period> &v) {
    v = std::chrono::duration<Rep, Period>{innerDecode<int64_t>(Get(j, key))};
  }

  template <typename T>
  inline Document encode(const T &v) {
    Document document;
    static_cast<Value &>(document) = encode(v, document.GetAllocator());
    return document;
  }

  template <typename T>
  inline T innerDecode(const Value &j) {
    T v{};
    decode(v, j);
    return v;
  }

  template <typename T>
  inline outcome::result<T> decode(const Value &j) {
    try {
      return innerDecode<T>(j);
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
  }

  /**
   * Encodes value as json document bytes
   */
  template <typename T>
  inline outcome::result<Bytes> encodeDocument(const T &v) {
    return format(encode(v));
  }

  /**
   * Decodes value from json document bytes
   */
  template <typename T>
  inline outcome::result<T> decodeDocument(const Bytes &input) {
    OUTCOME_TRY(document, parse(input));
    return decode<T>(document);
  }
}  // namespace ds::codec::json
