#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hap::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_seconds_t = int64_t;
using duration_seconds_t = int64_t;

// Content hashes are rendered as "sha256:<64 lowercase hex>".
using content_hash_t = std::string;

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_private_key_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::optional<hash32_t> try_make_hash32(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

/// URL-safe alphabet ('-' and '_'), padding stripped.
std::string to_base64url(const bytes_view_t& bytes);
/// Accepts URL-safe input with or without trailing padding. Unused bits of
/// the final character must be zero, so every payload has one encoding.
std::optional<bytes_t> try_from_base64url(std::string_view encoded);

/// Well-formed UTF-8: no overlong forms, surrogates or code points past
/// U+10FFFF.
bool is_valid_utf8(std::string_view text);

}  // namespace hap::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
