#pragma once

#include <hap/crypto/signing_context.hpp>
#include <hap/schema/primitives.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hap::crypto {

/// Published signing-authority public keys, addressed by key id.
class key_registry final {
 public:
  void add(std::string kid, const hap::schema::ed25519_public_key_t& key);
  void add(const signing_context& context);

  /// False when `hex` is not a 32-byte hex public key.
  bool add_hex(std::string kid, std::string_view hex);

  std::optional<hap::schema::ed25519_public_key_t> find(
      std::string_view kid) const;
  std::optional<std::string> find_hex(std::string_view kid) const;

  std::vector<std::string> key_ids() const;
  bool empty() const;

 private:
  std::map<std::string, hap::schema::ed25519_public_key_t, std::less<>> keys_;
};

}  // namespace hap::crypto
