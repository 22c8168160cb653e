#pragma once

#include <string>
#include <vector>

// Schema type: sdg definition.
// A Signal Detection Guide as published by the signing authority.
namespace hap::schema {

struct sdg_definition_t final {
  std::string id;
  std::string signal_intent;
  std::string description;
  std::vector<std::string> observable_structures;
  std::vector<std::string> detection_rules;
  bool stop_trigger{false};
  std::string user_prompt;
};

}  // namespace hap::schema
