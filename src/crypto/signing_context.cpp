#include <hap/common/critical.hpp>
#include <hap/crypto/signing_context.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

namespace hap::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::shared_ptr<EVP_PKEY> wrap(EVP_PKEY* key) {
  return std::shared_ptr<EVP_PKEY>{key, EVP_PKEY_free};
}

signing_context load_from_environment() {
  const auto* kid_env = std::getenv(kKeyIdEnv);
  auto kid = std::string{kid_env != nullptr && *kid_env != '\0'
                             ? std::string_view{kid_env}
                             : kDefaultKeyId};

  const auto* key_env = std::getenv(kPrivateKeyEnv);
  if (key_env != nullptr && *key_env != '\0') {
    auto context = signing_context::from_private_key_hex(key_env, kid);
    if (!context) {
      hap::common::critical("HAP_SP_PRIVATE_KEY is not a 32-byte hex seed");
    }
    spdlog::info("Loaded signing key '{}' from environment", kid);
    return std::move(*context);
  }

  spdlog::warn(
      "HAP_SP_PRIVATE_KEY not set, generating ephemeral signing key '{}'",
      kid);
  return signing_context::generate(std::move(kid));
}

}  // namespace

signing_context::signing_context(std::shared_ptr<EVP_PKEY> key,
                                 std::string kid)
    : key_{std::move(key)}, kid_{std::move(kid)} {
  auto size = public_key_.size();
  if (EVP_PKEY_get_raw_public_key(key_.get(), public_key_.data(), &size) !=
          1 ||
      size != public_key_.size()) {
    hap::common::critical("failed to extract Ed25519 public key");
  }
}

signing_context signing_context::generate(std::string kid) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
      EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    hap::common::critical("Ed25519 key generation failed");
  }
  return signing_context{wrap(raw), std::move(kid)};
}

std::optional<signing_context> signing_context::from_private_key(
    const hap::schema::ed25519_private_key_t& seed,
    std::string kid) {
  auto* raw = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                           seed.data(), seed.size());
  if (raw == nullptr) {
    return std::nullopt;
  }
  return signing_context{wrap(raw), std::move(kid)};
}

std::optional<signing_context> signing_context::from_private_key_hex(
    const std::string_view hex,
    std::string kid) {
  auto bytes = hap::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != sizeof(hap::schema::ed25519_private_key_t)) {
    return std::nullopt;
  }
  auto seed = hap::schema::ed25519_private_key_t{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(seed));
  return from_private_key(seed, std::move(kid));
}

hap::schema::ed25519_signature_t signing_context::sign(
    const hap::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto signature = hap::schema::ed25519_signature_t{};
  auto size = signature.size();
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
          1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    hap::common::critical("Ed25519 signing failed");
  }
  return signature;
}

const hap::schema::ed25519_public_key_t& signing_context::public_key() const {
  return public_key_;
}

std::string signing_context::public_key_hex() const {
  return hap::schema::to_hex(
      hap::schema::bytes_view_t{public_key_.data(), public_key_.size()});
}

std::string signing_context::private_key_hex() const {
  auto seed = hap::schema::ed25519_private_key_t{};
  auto size = seed.size();
  if (EVP_PKEY_get_raw_private_key(key_.get(), seed.data(), &size) != 1 ||
      size != seed.size()) {
    hap::common::critical("failed to extract Ed25519 private key");
  }
  return hap::schema::to_hex(
      hap::schema::bytes_view_t{seed.data(), seed.size()});
}

const std::string& signing_context::kid() const {
  return kid_;
}

const signing_context& shared_signing_context() {
  static const auto context = load_from_environment();
  return context;
}

}  // namespace hap::crypto
