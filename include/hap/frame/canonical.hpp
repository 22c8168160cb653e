#pragma once

#include <hap/schema/primitives.hpp>
#include <hap/schema/profile.hpp>
#include <hap/schema/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hap::frame {

/// Raw Frame values keyed by field name. Supply order never matters; the
/// canonical form follows the profile's key order.
using frame_fields_t = std::map<std::string, std::string>;

/// Typed view of a deploy-gate Frame. `disclosure_hash` is bound only by
/// v0.2 profiles.
struct deploy_frame_t final {
  std::string repo;
  std::string sha;
  std::string env;
  std::string profile;
  std::string path;
  std::optional<std::string> disclosure_hash;
};

frame_fields_t make_frame_fields(const deploy_frame_t& frame);

/// Validate one value against its profile field definition.
///
/// Returns the violation message, or std::nullopt when the value is valid.
std::optional<std::string> validate_frame_field(
    std::string_view name,
    std::string_view value,
    const hap::schema::profile_t& profile);

/// Every violation in `fields`: unknown fields, missing required fields,
/// pattern and allowed-value failures.
std::vector<std::string> validate_frame(const frame_fields_t& fields,
                                        const hap::schema::profile_t& profile);

/// Newline-joined `key=value` lines in the profile's key order.
///
/// Fails with `validation_error` listing every violation.
hap::schema::result<std::string> canonical_frame(
    const frame_fields_t& fields,
    const hap::schema::profile_t& profile);

hap::schema::content_hash_t frame_hash(std::string_view canonical);

hap::schema::result<hap::schema::content_hash_t> compute_frame_hash(
    const frame_fields_t& fields,
    const hap::schema::profile_t& profile);

}  // namespace hap::frame
