#pragma once
#include <hap/schema/disclosure.hpp>

#include <nlohmann/json.hpp>

namespace hap::schema {

void to_json(nlohmann::ordered_json& j, const decision_file_t& o);
void from_json(const nlohmann::ordered_json& j, decision_file_t& o);

}  // namespace hap::schema
