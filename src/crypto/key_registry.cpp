#include <hap/crypto/key_registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hap::crypto {

void key_registry::add(std::string kid,
                       const hap::schema::ed25519_public_key_t& key) {
  spdlog::debug("Registered public key '{}'", kid);
  keys_.insert_or_assign(std::move(kid), key);
}

void key_registry::add(const signing_context& context) {
  add(context.kid(), context.public_key());
}

bool key_registry::add_hex(std::string kid, const std::string_view hex) {
  auto bytes = hap::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != sizeof(hap::schema::ed25519_public_key_t)) {
    spdlog::warn("Rejected public key '{}': not 32 bytes of hex", kid);
    return false;
  }
  auto key = hap::schema::ed25519_public_key_t{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(key));
  add(std::move(kid), key);
  return true;
}

std::optional<hap::schema::ed25519_public_key_t> key_registry::find(
    const std::string_view kid) const {
  auto it = keys_.find(kid);
  if (it == std::end(keys_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> key_registry::find_hex(
    const std::string_view kid) const {
  auto key = find(kid);
  if (!key) {
    return std::nullopt;
  }
  return hap::schema::to_hex(hap::schema::bytes_view_t{key->data(), key->size()});
}

std::vector<std::string> key_registry::key_ids() const {
  auto ids = std::vector<std::string>{};
  ids.reserve(keys_.size());
  for (const auto& [kid, _] : keys_) {
    ids.push_back(kid);
  }
  return ids;
}

bool key_registry::empty() const {
  return keys_.empty();
}

}  // namespace hap::crypto
