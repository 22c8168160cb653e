#include <hap/profile/registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.profile";

std::vector<frame_field_t> make_frame_fields(const bool with_disclosure_hash) {
  auto fields = std::vector<frame_field_t>{
      frame_field_t{.name = "repo",
                    .description = "Repository slug (owner/name)",
                    .pattern = R"(^[a-z0-9_.-]+\/[a-z0-9_.-]+$)"},
      frame_field_t{.name = "sha",
                    .description = "Git commit SHA (40 hex characters)",
                    .pattern = "^[a-f0-9]{40}$"},
      frame_field_t{.name = "env",
                    .description = "Deployment environment",
                    .pattern = "^(prod|staging)$",
                    .allowed_values = {"prod", "staging"}},
      frame_field_t{.name = "profile",
                    .description = "Profile identifier with version",
                    .pattern = R"(^[a-z0-9_-]+@[0-9]+\.[0-9]+$)"},
      frame_field_t{.name = "path",
                    .description = "Execution path identifier",
                    .pattern = "^[a-z0-9_-]+$"},
  };
  if (with_disclosure_hash) {
    fields.push_back(
        frame_field_t{.name = "disclosure_hash",
                      .description = "SHA-256 hash of the disclosure content",
                      .pattern = "^sha256:[a-f0-9]{64}$"});
  }
  return fields;
}

disclosure_field_t text_field(std::string name,
                              std::string description,
                              const std::size_t min_length,
                              const std::size_t max_length) {
  return disclosure_field_t{.name = std::move(name),
                            .type = disclosure_field_type_t::string,
                            .description = std::move(description),
                            .min_length = min_length,
                            .max_length = max_length};
}

disclosure_field_t list_field(std::string name, std::string description) {
  return disclosure_field_t{.name = std::move(name),
                            .type = disclosure_field_type_t::string_list,
                            .description = std::move(description)};
}

execution_path_t prod_path(std::string description,
                           std::vector<std::string> domains) {
  auto path = execution_path_t{.description = std::move(description)};
  for (const auto& domain : domains) {
    path.required_scopes.push_back(
        scope_requirement_t{.domain = domain, .env = "prod"});
  }
  path.required_domains = std::move(domains);
  return path;
}

std::vector<scope_substitution_t> default_substitutions() {
  return {scope_substitution_t{.required_domain = "release_management",
                               .substitute_domain = "security"}};
}

profile_t make_deploy_gate_v02() {
  auto profile = profile_t{};
  profile.id = std::string{hap::profile::kDeployGateV02};
  profile.version = "0.2";
  profile.protocol = protocol_version_t::v0_2;
  profile.required_gates = {"frame",     "problem",    "objective",
                            "tradeoff",  "commitment", "decision_owner"};
  profile.frame_schema = frame_schema_t{
      .key_order = {"repo", "sha", "env", "profile", "path", "disclosure_hash"},
      .fields = make_frame_fields(true)};
  profile.disclosure_schema.shared = {
      text_field("repo", "Repository being deployed", 1, 200),
      text_field("sha", "Commit SHA being deployed", 1, 64),
      list_field("changed_paths", "Files changed in this commit"),
      list_field("risk_flags", "Detected risk indicators"),
  };
  profile.disclosure_schema.domains["engineering"] = {
      text_field("problem",
                 "What technical problem does this change solve?", 20, 500),
      text_field(
          "objective",
          "What outcome are you approving from an engineering perspective?",
          20, 500),
      text_field("tradeoffs",
                 "What technical risks or costs are you accepting?", 20, 500),
  };
  profile.disclosure_schema.domains["release_management"] = {
      text_field("problem",
                 "What release/operational problem does this address?", 20,
                 500),
      text_field("objective",
                 "What outcome are you approving from a release perspective?",
                 20, 500),
      text_field("tradeoffs",
                 "What operational risks or costs are you accepting?", 20, 500),
  };
  profile.execution_paths["deploy-prod-canary"] =
      prod_path("Canary deployment to production (limited rollout)",
                {"engineering"});
  profile.execution_paths["deploy-prod-full"] =
      prod_path("Full deployment to production (immediate rollout)",
                {"engineering", "release_management"});
  profile.substitutions = default_substitutions();
  profile.ttl = ttl_policy_t{.default_ttl = 3600, .max_ttl = 86400};
  profile.sdg_set = {
      "deploy/missing_decision_owner@1.0",
      "deploy/commitment_mismatch@1.0",
      "deploy/tradeoff_execution_mismatch@1.0",
      "deploy/objective_diff_mismatch@1.0",
  };
  return profile;
}

profile_t make_deploy_gate_v03() {
  auto profile = profile_t{};
  profile.id = std::string{hap::profile::kDeployGateV03};
  profile.version = "0.3";
  profile.protocol = protocol_version_t::v0_3;
  profile.required_gates = {"frame", "decision_owner", "disclosure_review",
                            "commitment"};
  // The v0.3 Frame no longer binds a disclosure hash; each domain's
  // disclosure hash travels in the attestation instead.
  profile.frame_schema =
      frame_schema_t{.key_order = {"repo", "sha", "env", "profile", "path"},
                     .fields = make_frame_fields(false)};
  profile.disclosure_schema.shared = {
      text_field("repo", "Repository being deployed", 1, 200),
      text_field("sha", "Commit SHA being deployed", 1, 64),
  };
  profile.disclosure_schema.domains["engineering"] = {
      text_field("diff_summary", "Summary of the changes being deployed", 10,
                 1000),
      list_field("changed_paths", "List of files changed in this commit"),
      text_field("test_status", "Status of automated tests", 10, 500),
      text_field("rollback_strategy",
                 "How to revert if issues are discovered", 10, 500),
  };
  profile.disclosure_schema.domains["release_management"] = {
      text_field("deployment_window", "When this deployment should occur", 5,
                 200),
      text_field("rollback_plan", "Operational rollback procedure", 10, 500),
      text_field("monitoring_dashboards", "Links to monitoring dashboards", 3,
                 500),
  };
  profile.disclosure_schema.domains["marketing"] = {
      text_field("behavior_change_summary",
                 "How user-visible behavior changes", 10, 1000),
      text_field("demo_url", "Preview URL to see the changes", 5, 500),
      text_field("rollout_plan",
                 "How the change will be rolled out to users", 10, 500),
  };
  profile.disclosure_schema.domains["security"] = {
      list_field("affected_surfaces",
                 "Security surfaces affected by this change"),
      text_field("threat_category", "Category of security concern", 5, 200),
      text_field("mitigation_path", "How security risks are mitigated", 10,
                 500),
  };
  profile.execution_paths["deploy-prod-canary"] =
      prod_path("Canary deployment to production (limited rollout)",
                {"engineering"});
  profile.execution_paths["deploy-prod-full"] =
      prod_path("Full deployment to production (immediate rollout)",
                {"engineering", "release_management"});
  profile.execution_paths["deploy-prod-user-facing"] = prod_path(
      "User-facing feature deployment", {"engineering", "marketing"});
  profile.execution_paths["deploy-prod-security"] = prod_path(
      "Security-sensitive deployment", {"engineering", "security"});
  profile.substitutions = default_substitutions();
  profile.ttl = ttl_policy_t{.default_ttl = 3600, .max_ttl = 86400};
  profile.sdg_set = {
      "deploy/missing_decision_owner@1.0",
      "deploy/commitment_mismatch@1.0",
      "deploy/decision_file_missing@1.0",
      "deploy/disclosure_incomplete@1.0",
  };
  return profile;
}

}  // namespace

namespace hap::profile {

const profile_t& deploy_gate_v02() {
  static const auto profile = make_deploy_gate_v02();
  return profile;
}

const profile_t& deploy_gate_v03() {
  static const auto profile = make_deploy_gate_v03();
  return profile;
}

const profile_t& latest_profile() {
  return deploy_gate_v03();
}

std::vector<std::string_view> profile_ids() {
  return {kDeployGateV02, kDeployGateV03};
}

const profile_t* find_profile(const std::string_view profile_id) {
  if (profile_id == kDeployGateV03) {
    return &deploy_gate_v03();
  }
  if (profile_id == kDeployGateV02) {
    return &deploy_gate_v02();
  }
  return nullptr;
}

result<const profile_t*> resolve_profile(const std::string_view profile_id) {
  const auto* profile = find_profile(profile_id);
  if (profile == nullptr) {
    spdlog::warn("Unknown profile '{}'", profile_id);
    return make_error(error_code::unknown_profile,
                      "unknown profile '" + std::string{profile_id} + "'", {},
                      kCodespace);
  }
  return profile;
}

const execution_path_t* find_execution_path(
    const profile_t& profile,
    const std::string_view execution_path) {
  auto it = profile.execution_paths.find(std::string{execution_path});
  if (it == std::end(profile.execution_paths)) {
    return nullptr;
  }
  return &it->second;
}

result<const execution_path_t*> resolve_execution_path(
    const profile_t& profile,
    const std::string_view execution_path) {
  const auto* path = find_execution_path(profile, execution_path);
  if (path == nullptr) {
    auto allowed = std::vector<std::string>{};
    for (const auto& [id, _] : profile.execution_paths) {
      allowed.push_back("allowed execution path: " + id);
    }
    return make_error(error_code::unknown_execution_path,
                      "unknown execution path '" +
                          std::string{execution_path} + "' for profile " +
                          profile.id,
                      std::move(allowed), kCodespace);
  }
  return path;
}

const frame_field_t* find_frame_field(const profile_t& profile,
                                      const std::string_view name) {
  auto it = std::ranges::find_if(
      profile.frame_schema.fields,
      [&](const frame_field_t& field) { return field.name == name; });
  if (it == std::end(profile.frame_schema.fields)) {
    return nullptr;
  }
  return &*it;
}

const std::vector<disclosure_field_t>* find_domain_schema(
    const profile_t& profile,
    const std::string_view domain) {
  auto it = profile.disclosure_schema.domains.find(std::string{domain});
  if (it == std::end(profile.disclosure_schema.domains)) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace hap::profile
