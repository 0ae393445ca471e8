/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "claims/signing_key.hpp"

#include <memory>

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include "claims/claims_error.hpp"

namespace ds::claims {

  namespace {
    using Bio = std::shared_ptr<BIO>;
    using Key = std::shared_ptr<EC_KEY>;

    Bio memoryBio() {
      return {BIO_new(BIO_s_mem()), BIO_free};
    }

    std::string bioString(const Bio &bio) {
      char *data{nullptr};
      auto size = BIO_get_mem_data(bio.get(), &data);
      return {data, static_cast<size_t>(size)};
    }

    outcome::result<std::string> publicPem(const Key &key) {
      auto bio = memoryBio();
      if (!bio || PEM_write_bio_EC_PUBKEY(bio.get(), key.get()) != 1) {
        return ClaimsError::kInvalidKey;
      }
      return bioString(bio);
    }
  }  // namespace

  outcome::result<SigningKey> generateSigningKey() {
    Key key{EC_KEY_new_by_curve_name(NID_X9_62_prime256v1), EC_KEY_free};
    if (!key || EC_KEY_generate_key(key.get()) != 1) {
      return ClaimsError::kInvalidKey;
    }
    auto bio = memoryBio();
    if (!bio
        || PEM_write_bio_ECPrivateKey(
               bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr)
               != 1) {
      return ClaimsError::kInvalidKey;
    }
    SigningKey pair;
    pair.private_key = bioString(bio);
    OUTCOME_TRYA(pair.public_key, publicPem(key));
    return pair;
  }

  outcome::result<std::string> derivePublicKey(const std::string &private_key) {
    Bio bio{BIO_new_mem_buf(private_key.data(),
                            static_cast<int>(private_key.size())),
            BIO_free};
    if (!bio) {
      return ClaimsError::kInvalidKey;
    }
    Key key{PEM_read_bio_ECPrivateKey(bio.get(), nullptr, nullptr, nullptr),
            EC_KEY_free};
    if (!key) {
      return ClaimsError::kInvalidKey;
    }
    return publicPem(key);
  }

}  // namespace ds::claims
