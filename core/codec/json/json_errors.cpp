/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::codec::json, JsonError, e) {
  using E = ds::codec::json::JsonError;
  switch (e) {
    case E::kParseError:
      return "JsonError: malformed document";
    case E::kWrongEnum:
      return "JsonError: wrong enum";
    case E::kWrongType:
      return "JsonError: wrong type";
    case E::kOutOfRange:
      return "JsonError: missing member";
    case E::kFormatError:
      return "JsonError: cannot format document";
  }

  return "JsonError: unknown error code";
}
