#pragma once

#include <hap/schema/primitives.hpp>

#include <openssl/types.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hap::crypto {

inline constexpr auto kDefaultKeyId = std::string_view{"hap-sp-v1"};
inline constexpr auto kPrivateKeyEnv = "HAP_SP_PRIVATE_KEY";
inline constexpr auto kKeyIdEnv = "HAP_SP_KEY_ID";

/// One Ed25519 key pair of the signing authority and the key id it is
/// published under. Read-only once constructed; copies share the key.
class signing_context final {
 public:
  static signing_context generate(std::string kid);

  /// Load from a 32-byte seed. std::nullopt when OpenSSL rejects the key.
  static std::optional<signing_context> from_private_key(
      const hap::schema::ed25519_private_key_t& seed,
      std::string kid);
  static std::optional<signing_context> from_private_key_hex(
      std::string_view hex,
      std::string kid);

  hap::schema::ed25519_signature_t sign(
      const hap::schema::bytes_view_t& message) const;

  const hap::schema::ed25519_public_key_t& public_key() const;
  std::string public_key_hex() const;
  std::string private_key_hex() const;
  const std::string& kid() const;

 private:
  signing_context(std::shared_ptr<EVP_PKEY> key, std::string kid);

  std::shared_ptr<EVP_PKEY> key_;
  hap::schema::ed25519_public_key_t public_key_{};
  std::string kid_;
};

/// Process-wide signing context, initialised once on first use from
/// HAP_SP_PRIVATE_KEY (hex seed) and HAP_SP_KEY_ID. Without a configured
/// key an ephemeral pair is generated and a warning logged.
const signing_context& shared_signing_context();

}  // namespace hap::crypto
