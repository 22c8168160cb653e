#pragma once
#include <hap/schema/primitives.hpp>

#include <string_view>

namespace hap::sha256 {

inline constexpr auto kContentHashPrefix = std::string_view{"sha256:"};

hap::schema::hash32_t hash(const std::string_view& str);
hap::schema::hash32_t hash(const hap::schema::bytes_view_t& bytes);

/// "sha256:" followed by the lowercase hex digest of `canonical`.
hap::schema::content_hash_t content_hash(const std::string_view& canonical);

/// True when `value` has the exact "sha256:<64 lowercase hex>" shape.
bool is_content_hash(std::string_view value);

}  // namespace hap::sha256
