#pragma once
#include <hap/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Schema type: profile.
// A profile is the immutable schema of one protocol version. It carries no
// behaviour; stateless functions consult it.
namespace hap::schema {

enum class protocol_version_t : uint8_t { v0_2 = 2, v0_3 = 3 };

struct frame_field_t final {
  std::string name;
  std::string description;
  // ECMAScript regular expression, anchored by the pattern itself.
  std::string pattern;
  bool required{true};
  std::vector<std::string> allowed_values;
};

struct frame_schema_t final {
  std::vector<std::string> key_order;
  std::vector<frame_field_t> fields;
};

enum class disclosure_field_type_t : uint8_t { string = 0, string_list = 1 };

struct disclosure_field_t final {
  std::string name;
  disclosure_field_type_t type{disclosure_field_type_t::string};
  std::string description;
  std::optional<std::size_t> min_length;
  std::optional<std::size_t> max_length;
};

struct disclosure_schema_t final {
  std::vector<disclosure_field_t> shared;
  std::map<std::string, std::vector<disclosure_field_t>> domains;
};

struct scope_requirement_t final {
  std::string domain;
  std::string env;
};

struct execution_path_t final {
  std::string description;
  std::vector<std::string> required_domains;
  std::vector<scope_requirement_t> required_scopes;
};

// `substitute_domain` may satisfy a requirement for `required_domain`.
// The relation is directional.
struct scope_substitution_t final {
  std::string required_domain;
  std::string substitute_domain;
};

struct ttl_policy_t final {
  duration_seconds_t default_ttl{3600};
  duration_seconds_t max_ttl{86400};
};

struct profile_t final {
  std::string id;
  std::string version;
  protocol_version_t protocol{protocol_version_t::v0_3};
  std::vector<std::string> required_gates;
  frame_schema_t frame_schema;
  disclosure_schema_t disclosure_schema;
  std::map<std::string, execution_path_t> execution_paths;
  std::vector<scope_substitution_t> substitutions;
  ttl_policy_t ttl;
  std::vector<std::string> sdg_set;
};

}  // namespace hap::schema
