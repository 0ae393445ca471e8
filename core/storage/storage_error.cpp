/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::storage, StorageError, e) {
  using E = ds::storage::StorageError;
  switch (e) {
    case E::kNotFound:
      return "StorageError: key not found";
  }
  return "StorageError: unknown error";
}
