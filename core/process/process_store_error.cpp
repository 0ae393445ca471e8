/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "process/process_store_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ds::process, ProcessStoreError, e) {
  using E = ds::process::ProcessStoreError;
  switch (e) {
    case E::kNotFound:
      return "ProcessStoreError: process not found";
    case E::kConcurrentModification:
      return "ProcessStoreError: process is being modified concurrently";
  }
  return "ProcessStoreError: unknown error";
}
