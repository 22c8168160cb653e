#pragma once

#include <hap/schema/result.hpp>
#include <hap/schema/sdg_definition.hpp>

#include <string_view>
#include <vector>

namespace hap::sdg {

/// Definitions published by the signing authority for the deploy gate.
const std::vector<hap::schema::sdg_definition_t>& builtin_definitions();

/// Look up a builtin definition by id, or nullptr when unknown.
const hap::schema::sdg_definition_t* find_definition(std::string_view id);

/// Parse definitions from JSON: either a single definition object or an
/// array of them. Fails with `validation_error`.
hap::schema::result<std::vector<hap::schema::sdg_definition_t>>
load_definitions(std::string_view json);

}  // namespace hap::sdg
