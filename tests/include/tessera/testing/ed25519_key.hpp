#pragma once

#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <tessera/schema/primitives.hpp>

#include <memory>
#include <optional>
#include <utility>

namespace tessera::testing {

struct pkey_deleter final {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

/// Throwaway ed25519 key pair for signing test messages.
class ed25519_key final {
 public:
  static std::optional<ed25519_key> generate() {
    auto* keygen_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (keygen_ctx == nullptr) {
      return std::nullopt;
    }
    auto* pkey = static_cast<EVP_PKEY*>(nullptr);
    auto generated = EVP_PKEY_keygen_init(keygen_ctx) == 1 &&
                     EVP_PKEY_keygen(keygen_ctx, &pkey) == 1;
    EVP_PKEY_CTX_free(keygen_ctx);
    if (!generated) {
      return std::nullopt;
    }
    auto key = ed25519_key{std::unique_ptr<EVP_PKEY, pkey_deleter>{pkey}};
    auto size = key.signer_.public_key.size();
    if (EVP_PKEY_get_raw_public_key(pkey, key.signer_.public_key.data(),
                                    &size) != 1) {
      return std::nullopt;
    }
    return key;
  }

  const tessera::schema::ed25519_signer_id& signer() const { return signer_; }

  tessera::schema::signature_t sign(
      const tessera::schema::bytes_t& message) const {
    auto signature = tessera::schema::ed25519_signature_t{};
    auto size = signature.size();
    auto* sign_ctx = EVP_MD_CTX_new();
    EXPECT_NE(sign_ctx, nullptr);
    EXPECT_EQ(
        EVP_DigestSignInit(sign_ctx, nullptr, nullptr, nullptr, key_.get()),
        1);
    EXPECT_EQ(EVP_DigestSign(sign_ctx, signature.data(), &size,
                             message.data(), message.size()),
              1);
    EVP_MD_CTX_free(sign_ctx);
    return signature;
  }

 private:
  explicit ed25519_key(std::unique_ptr<EVP_PKEY, pkey_deleter> key)
      : key_{std::move(key)} {}

  std::unique_ptr<EVP_PKEY, pkey_deleter> key_;
  tessera::schema::ed25519_signer_id signer_{};
};

}  // namespace tessera::testing
