#include <hap/schema/encoding/json/sdg_definition.hpp>

namespace hap::schema {

void to_json(nlohmann::ordered_json& j, const sdg_definition_t& o) {
  j = nlohmann::ordered_json{
      {"id", o.id},
      {"signal_intent", o.signal_intent},
      {"description", o.description},
      {"observable_structures", o.observable_structures},
      {"detection_rules", o.detection_rules},
      {"stop_trigger", o.stop_trigger},
      {"user_prompt", o.user_prompt}};
}

void from_json(const nlohmann::ordered_json& j, sdg_definition_t& o) {
  j.at("id").get_to(o.id);
  o.signal_intent = j.value("signal_intent", std::string{});
  o.description = j.value("description", std::string{});
  o.observable_structures =
      j.value("observable_structures", std::vector<std::string>{});
  j.at("detection_rules").get_to(o.detection_rules);
  j.at("stop_trigger").get_to(o.stop_trigger);
  o.user_prompt = j.value("user_prompt", std::string{});
}

}  // namespace hap::schema
