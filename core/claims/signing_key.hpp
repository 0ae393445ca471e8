/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DS_CORE_CLAIMS_SIGNING_KEY_HPP
#define DS_CORE_CLAIMS_SIGNING_KEY_HPP

#include <string>

#include "common/outcome.hpp"

namespace ds::claims {

  /// ES256 (P-256) key pair in PEM encoding
  struct SigningKey {
    std::string private_key;
    std::string public_key;
  };

  /// Generates new P-256 key pair
  outcome::result<SigningKey> generateSigningKey();

  /**
   * Derives PEM public key of PEM private key
   * @return kInvalidKey if private key cannot be parsed
   */
  outcome::result<std::string> derivePublicKey(const std::string &private_key);

}  // namespace ds::claims

#endif  // DS_CORE_CLAIMS_SIGNING_KEY_HPP
