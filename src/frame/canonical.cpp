#include <hap/frame/canonical.hpp>
#include <hap/profile/registry.hpp>
#include <hap/sha256/hash.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.frame";

std::string join(const std::vector<std::string>& values,
                 const std::string_view separator) {
  auto out = std::string{};
  for (const auto& value : values) {
    if (!out.empty()) {
      out += separator;
    }
    out += value;
  }
  return out;
}

}  // namespace

namespace hap::frame {

frame_fields_t make_frame_fields(const deploy_frame_t& frame) {
  auto fields = frame_fields_t{{"repo", frame.repo},
                               {"sha", frame.sha},
                               {"env", frame.env},
                               {"profile", frame.profile},
                               {"path", frame.path}};
  if (frame.disclosure_hash) {
    fields.emplace("disclosure_hash", *frame.disclosure_hash);
  }
  return fields;
}

std::optional<std::string> validate_frame_field(const std::string_view name,
                                                const std::string_view value,
                                                const profile_t& profile) {
  const auto* field = hap::profile::find_frame_field(profile, name);
  if (field == nullptr) {
    return "Unknown field \"" + std::string{name} +
           "\" not defined in profile " + profile.id;
  }

  const auto pattern = std::regex{field->pattern, std::regex::ECMAScript};
  const auto text = std::string{value};
  if (!std::regex_search(text, pattern)) {
    return "Invalid " + field->name + ": \"" + text +
           "\" does not match pattern " + field->pattern;
  }

  if (!field->allowed_values.empty() &&
      std::ranges::find(field->allowed_values, text) ==
          std::end(field->allowed_values)) {
    return "Invalid " + field->name + ": \"" + text +
           "\" not in allowed values [" + join(field->allowed_values, ", ") +
           "]";
  }
  return std::nullopt;
}

std::vector<std::string> validate_frame(const frame_fields_t& fields,
                                        const profile_t& profile) {
  auto violations = std::vector<std::string>{};
  for (const auto& field : profile.frame_schema.fields) {
    if (field.required && !fields.contains(field.name)) {
      violations.push_back("Missing required field: " + field.name);
    }
  }

  for (const auto& [name, value] : fields) {
    if (auto violation = validate_frame_field(name, value, profile)) {
      violations.push_back(std::move(*violation));
    }
  }

  // A Frame naming another profile would be hashed under the wrong schema.
  auto declared = fields.find("profile");
  if (declared != std::end(fields) && declared->second != profile.id) {
    violations.push_back("Frame profile \"" + declared->second +
                         "\" does not match schema profile " + profile.id);
  }
  return violations;
}

result<std::string> canonical_frame(const frame_fields_t& fields,
                                    const profile_t& profile) {
  auto violations = validate_frame(fields, profile);
  if (!violations.empty()) {
    spdlog::debug("Rejected frame for profile {} with {} violation(s)",
                  profile.id, violations.size());
    auto log = "Invalid frame parameters: " + join(violations, "; ");
    return make_error(error_code::validation_error, std::move(log),
                      std::move(violations), kCodespace);
  }

  auto lines = std::vector<std::string>{};
  lines.reserve(profile.frame_schema.key_order.size());
  for (const auto& key : profile.frame_schema.key_order) {
    auto it = fields.find(key);
    lines.push_back(key + "=" + (it == std::end(fields) ? "" : it->second));
  }
  return join(lines, "\n");
}

content_hash_t frame_hash(const std::string_view canonical) {
  return hap::sha256::content_hash(canonical);
}

result<content_hash_t> compute_frame_hash(const frame_fields_t& fields,
                                          const profile_t& profile) {
  auto canonical = canonical_frame(fields, profile);
  if (!canonical) {
    return canonical.error();
  }
  return frame_hash(canonical.value());
}

}  // namespace hap::frame
