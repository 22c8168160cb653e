#pragma once
#include <hap/schema/sdg_definition.hpp>

#include <nlohmann/json.hpp>

namespace hap::schema {

void to_json(nlohmann::ordered_json& j, const sdg_definition_t& o);
void from_json(const nlohmann::ordered_json& j, sdg_definition_t& o);

}  // namespace hap::schema
