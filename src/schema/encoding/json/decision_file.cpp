#include <hap/schema/encoding/json/decision_file.hpp>

namespace hap::schema {

void to_json(nlohmann::ordered_json& j, const decision_file_t& o) {
  auto disclosure = nlohmann::ordered_json::object();
  for (const auto& [domain, fields] : o.disclosure) {
    auto entry = nlohmann::ordered_json::object();
    for (const auto& field : fields) {
      std::visit([&](const auto& v) { entry[field.first] = v; }, field.second);
    }
    disclosure[domain] = std::move(entry);
  }
  j = nlohmann::ordered_json{{"profile", o.profile},
                             {"execution_path", o.execution_path},
                             {"disclosure", std::move(disclosure)}};
}

void from_json(const nlohmann::ordered_json& j, decision_file_t& o) {
  // Both keys are optional in authored files; callers fall back to the
  // request values.
  o.profile = j.value("profile", std::string{});
  o.execution_path = j.value("execution_path", std::string{});
  o.disclosure.clear();
  const auto& disclosure = j.at("disclosure");
  if (!disclosure.is_object()) {
    throw nlohmann::ordered_json::type_error::create(
        302, "disclosure must be an object keyed by domain", &disclosure);
  }
  for (const auto& [domain, fields] : disclosure.items()) {
    if (!fields.is_object()) {
      throw nlohmann::ordered_json::type_error::create(
          302, "disclosure for domain '" + domain + "' must be an object",
          &fields);
    }
    auto entry = domain_disclosure_t{};
    for (const auto& [name, value] : fields.items()) {
      if (value.is_array()) {
        entry.emplace(name, value.get<std::vector<std::string>>());
      } else {
        entry.emplace(name, value.get<std::string>());
      }
    }
    o.disclosure.emplace(domain, std::move(entry));
  }
}

}  // namespace hap::schema
