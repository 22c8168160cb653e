#pragma once

#include <hap/schema/profile.hpp>
#include <hap/schema/result.hpp>

#include <string_view>
#include <vector>

namespace hap::profile {

inline constexpr auto kDeployGateV02 = std::string_view{"deploy-gate@0.2"};
inline constexpr auto kDeployGateV03 = std::string_view{"deploy-gate@0.3"};

const hap::schema::profile_t& deploy_gate_v02();
const hap::schema::profile_t& deploy_gate_v03();

/// Newest registered profile.
const hap::schema::profile_t& latest_profile();

/// Every registered profile id, oldest first.
std::vector<std::string_view> profile_ids();

/// Look up a profile by id, or nullptr when unknown.
const hap::schema::profile_t* find_profile(std::string_view profile_id);

/// Look up a profile by id, failing with `unknown_profile`.
hap::schema::result<const hap::schema::profile_t*> resolve_profile(
    std::string_view profile_id);

const hap::schema::execution_path_t* find_execution_path(
    const hap::schema::profile_t& profile,
    std::string_view execution_path);

/// Look up an execution path, failing with `unknown_execution_path`.
hap::schema::result<const hap::schema::execution_path_t*>
resolve_execution_path(const hap::schema::profile_t& profile,
                       std::string_view execution_path);

const hap::schema::frame_field_t* find_frame_field(
    const hap::schema::profile_t& profile,
    std::string_view name);

const std::vector<hap::schema::disclosure_field_t>* find_domain_schema(
    const hap::schema::profile_t& profile,
    std::string_view domain);

}  // namespace hap::profile
