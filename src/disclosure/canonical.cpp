#include <hap/disclosure/canonical.hpp>
#include <hap/profile/registry.hpp>
#include <hap/schema/encoding/json/encoder.hpp>
#include <hap/sha256/hash.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.disclosure";
constexpr auto kChangedPaths = "changed_paths";

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

bool has_parent_segment(const std::string_view path) {
  auto start = std::size_t{0};
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    if (path.substr(start, end - start) == "..") {
      return true;
    }
    start = end + 1;
  }
  return false;
}

const disclosure_field_t* find_field(const std::vector<disclosure_field_t>& fields,
                                     const std::string_view name) {
  auto it = std::ranges::find_if(
      fields, [&](const disclosure_field_t& field) { return field.name == name; });
  if (it == std::end(fields)) {
    return nullptr;
  }
  return &*it;
}

bool check_utf8(const std::string& qualified_name,
                const std::string_view value,
                std::vector<std::string>& violations) {
  if (is_valid_utf8(value)) {
    return true;
  }
  violations.push_back(qualified_name + " is not valid UTF-8");
  return false;
}

void check_length(const disclosure_field_t& field,
                  const std::string& qualified_name,
                  const std::string_view value,
                  std::vector<std::string>& violations) {
  const auto length = hap::disclosure::text_length(value);
  if (field.min_length && length < *field.min_length) {
    violations.push_back(qualified_name + " must be at least " +
                         std::to_string(*field.min_length) +
                         " characters (got " + std::to_string(length) + ")");
  }
  if (field.max_length && length > *field.max_length) {
    violations.push_back(qualified_name + " must be at most " +
                         std::to_string(*field.max_length) +
                         " characters (got " + std::to_string(length) + ")");
  }
}

void check_paths(const std::vector<std::string>& paths,
                 std::vector<std::string>& violations) {
  for (std::size_t i = 0; i < paths.size(); ++i) {
    const auto& path = paths[i];
    if (!check_utf8("changed_paths[" + std::to_string(i) + "]", path,
                    violations)) {
      continue;
    }
    if (!hap::disclosure::canonicalize_path(path)) {
      violations.push_back("Invalid path \"" + path +
                           "\": empty or escapes repository root");
    }
  }
}

hap::schema::error_t validation_failure(std::vector<std::string> violations,
                                        const std::string_view what) {
  spdlog::debug("Rejected {} with {} violation(s)", what, violations.size());
  auto log = "Invalid " + std::string{what} + ": " + join(violations, "; ");
  return make_error(error_code::validation_error, std::move(log),
                    std::move(violations), kCodespace);
}

result<std::string> dump(const nlohmann::json& document) {
  try {
    return document.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::strict);
  } catch (const nlohmann::json::type_error& ex) {
    return validation_failure({ex.what()}, "canonical document");
  }
}

}  // namespace

namespace hap::disclosure {

std::optional<std::string> canonicalize_path(const std::string_view path) {
  if (has_parent_segment(path)) {
    return std::nullopt;
  }

  auto out = std::string{};
  out.reserve(path.size());
  for (const auto c : path) {
    if (c == '/' && !out.empty() && out.back() == '/') {
      continue;
    }
    out.push_back(c);
  }
  while (out.starts_with("./")) {
    out.erase(0, 2);
  }
  if (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  if (out.empty()) {
    return std::nullopt;
  }
  return out;
}

result<std::vector<std::string>> canonicalize_paths(
    const std::vector<std::string>& paths) {
  auto violations = std::vector<std::string>{};
  check_paths(paths, violations);
  if (!violations.empty()) {
    return validation_failure(std::move(violations), "paths");
  }

  auto out = std::vector<std::string>{};
  out.reserve(paths.size());
  for (const auto& path : paths) {
    out.push_back(*canonicalize_path(path));
  }
  return sort_set_field(std::move(out));
}

std::vector<std::string> sort_set_field(std::vector<std::string> values) {
  std::ranges::sort(values);
  return values;
}

std::size_t text_length(const std::string_view text) {
  return static_cast<std::size_t>(std::ranges::count_if(text, [](const char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  }));
}

std::vector<std::string> validate_disclosure(const disclosure_v02_t& disclosure,
                                             const profile_t& profile) {
  auto violations = std::vector<std::string>{};
  const auto& shared = profile.disclosure_schema.shared;
  if (const auto* field = find_field(shared, "repo");
      field != nullptr && check_utf8("repo", disclosure.repo, violations)) {
    check_length(*field, "repo", disclosure.repo, violations);
  }
  if (const auto* field = find_field(shared, "sha");
      field != nullptr && check_utf8("sha", disclosure.sha, violations)) {
    check_length(*field, "sha", disclosure.sha, violations);
  }
  check_paths(disclosure.changed_paths, violations);
  for (std::size_t i = 0; i < disclosure.risk_flags.size(); ++i) {
    check_utf8("risk_flags[" + std::to_string(i) + "]",
               disclosure.risk_flags[i], violations);
  }

  for (const auto& [domain, rationale] : disclosure.domains) {
    if (!check_utf8("domain name", domain, violations)) {
      continue;
    }
    const auto* schema = hap::profile::find_domain_schema(profile, domain);
    if (schema == nullptr) {
      violations.push_back("Unknown domain \"" + domain +
                           "\" not defined in profile " + profile.id);
      continue;
    }
    const auto values = std::map<std::string_view, std::string_view>{
        {"problem", rationale.problem},
        {"objective", rationale.objective},
        {"tradeoffs", rationale.tradeoffs}};
    for (const auto& [name, value] : values) {
      const auto qualified = domain + "." + std::string{name};
      if (const auto* field = find_field(*schema, name);
          field != nullptr && check_utf8(qualified, value, violations)) {
        check_length(*field, qualified, value, violations);
      }
    }
  }
  return violations;
}

result<std::string> canonical_disclosure(const disclosure_v02_t& disclosure,
                                         const profile_t& profile) {
  auto violations = validate_disclosure(disclosure, profile);
  if (!violations.empty()) {
    return validation_failure(std::move(violations), "disclosure");
  }

  auto paths = canonicalize_paths(disclosure.changed_paths);
  if (!paths) {
    return paths.error();
  }

  auto document = nlohmann::json::object();
  document[kChangedPaths] = std::move(paths).value();
  document["repo"] = disclosure.repo;
  document["risk_flags"] = sort_set_field(disclosure.risk_flags);
  document["sha"] = disclosure.sha;
  if (!disclosure.domains.empty()) {
    auto domains = nlohmann::json::object();
    for (const auto& [domain, rationale] : disclosure.domains) {
      domains[domain] = nlohmann::json{{"objective", rationale.objective},
                                       {"problem", rationale.problem},
                                       {"tradeoffs", rationale.tradeoffs}};
    }
    document["domains"] = std::move(domains);
  }
  return dump(document);
}

result<content_hash_t> disclosure_hash(const disclosure_v02_t& disclosure,
                                       const profile_t& profile) {
  auto canonical = canonical_disclosure(disclosure, profile);
  if (!canonical) {
    return canonical.error();
  }
  return hap::sha256::content_hash(canonical.value());
}

std::vector<std::string> validate_domain_disclosure(
    const std::string_view domain,
    const domain_disclosure_t& fields,
    const profile_t& profile) {
  auto violations = std::vector<std::string>{};
  if (!check_utf8("domain name", domain, violations)) {
    return violations;
  }
  const auto* schema = hap::profile::find_domain_schema(profile, domain);
  if (schema == nullptr) {
    violations.push_back("Unknown domain \"" + std::string{domain} +
                         "\" not defined in profile " + profile.id);
    return violations;
  }

  const auto prefix = std::string{domain} + ".";
  for (const auto& field : *schema) {
    if (!fields.contains(field.name)) {
      violations.push_back("Missing required field: " + prefix + field.name);
    }
  }

  for (const auto& entry : fields) {
    const auto& name = entry.first;
    if (!check_utf8("field name in domain " + std::string{domain}, name,
                    violations)) {
      continue;
    }
    const auto* field = find_field(*schema, name);
    if (field == nullptr) {
      violations.push_back("Unknown field \"" + name + "\" in domain " +
                           std::string{domain});
      continue;
    }
    std::visit(
        overloaded{
            [&](const std::string& text) {
              if (field->type != disclosure_field_type_t::string) {
                violations.push_back(prefix + name +
                                     " must be a list of strings");
                return;
              }
              if (check_utf8(prefix + name, text, violations)) {
                check_length(*field, prefix + name, text, violations);
              }
            },
            [&](const std::vector<std::string>& items) {
              if (field->type != disclosure_field_type_t::string_list) {
                violations.push_back(prefix + name + " must be a string");
                return;
              }
              if (name == kChangedPaths) {
                check_paths(items, violations);
                return;
              }
              for (std::size_t i = 0; i < items.size(); ++i) {
                check_utf8(prefix + name + "[" + std::to_string(i) + "]",
                           items[i], violations);
              }
            },
        },
        entry.second);
  }
  return violations;
}

result<std::string> canonical_domain_disclosure(
    const std::string_view domain,
    const domain_disclosure_t& fields,
    const profile_t& profile) {
  auto violations = validate_domain_disclosure(domain, fields, profile);
  if (!violations.empty()) {
    return validation_failure(std::move(violations), "domain disclosure");
  }

  auto document = nlohmann::json::object();
  for (const auto& [name, value] : fields) {
    if (const auto* text = std::get_if<std::string>(&value)) {
      document[name] = *text;
      continue;
    }
    const auto& items = std::get<std::vector<std::string>>(value);
    if (name == kChangedPaths) {
      auto paths = canonicalize_paths(items);
      if (!paths) {
        return paths.error();
      }
      document[name] = std::move(paths).value();
    } else {
      document[name] = sort_set_field(items);
    }
  }
  return dump(document);
}

result<content_hash_t> domain_disclosure_hash(const std::string_view domain,
                                              const domain_disclosure_t& fields,
                                              const profile_t& profile) {
  auto canonical = canonical_domain_disclosure(domain, fields, profile);
  if (!canonical) {
    return canonical.error();
  }
  return hap::sha256::content_hash(canonical.value());
}

result<std::map<std::string, content_hash_t>> domain_disclosure_hashes(
    const decision_file_t& decision_file,
    const profile_t& profile) {
  auto violations = std::vector<std::string>{};
  if (!decision_file.profile.empty() && decision_file.profile != profile.id) {
    violations.push_back("Decision file profile \"" + decision_file.profile +
                         "\" does not match " + profile.id);
  }
  if (decision_file.disclosure.empty()) {
    violations.push_back("Decision file discloses no domains");
  }
  for (const auto& [domain, fields] : decision_file.disclosure) {
    auto found = validate_domain_disclosure(domain, fields, profile);
    std::ranges::move(found, std::back_inserter(violations));
  }
  if (!violations.empty()) {
    return validation_failure(std::move(violations), "decision file");
  }

  auto hashes = std::map<std::string, content_hash_t>{};
  for (const auto& [domain, fields] : decision_file.disclosure) {
    auto hash = domain_disclosure_hash(domain, fields, profile);
    if (!hash) {
      return hash.error();
    }
    hashes.emplace(domain, std::move(hash).value());
  }
  return hashes;
}

result<decision_file_t> parse_decision_file(const std::string_view text) {
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  auto error = std::string{};
  auto decoded = encoder.try_decode<decision_file_t>(text, error);
  if (!decoded) {
    spdlog::warn("Unreadable decision file: {}", error);
    return make_error(error_code::validation_error,
                      "Invalid decision file: " + error, {error}, kCodespace);
  }
  return std::move(*decoded);
}

}  // namespace hap::disclosure
