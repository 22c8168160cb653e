#pragma once

#include <hap/schema/attestation.hpp>
#include <hap/schema/profile.hpp>
#include <hap/schema/result.hpp>

#include <set>
#include <string>
#include <vector>

namespace hap::scope {

/// Outcome of matching collected attestations against what an execution
/// path requires.
struct coverage_t final {
  // Requirements nobody attested to. For domain-only coverage `env` is
  // empty.
  std::vector<hap::schema::scope_requirement_t> missing;
  std::vector<hap::schema::scope_substitution_t> substitutions_applied;
  // Nothing was collected at all; never treated as satisfied.
  bool no_attestations{false};

  bool satisfied() const { return !no_attestations && missing.empty(); }
};

/// v0.3 style: required domain names against attested domain names.
coverage_t domain_coverage(
    const std::vector<std::string>& required_domains,
    const std::set<std::string>& attested_domains,
    const std::vector<hap::schema::scope_substitution_t>& substitutions);

/// v0.2 style: required `{domain, env}` pairs against decision-owner scopes.
coverage_t scope_coverage(
    const std::vector<hap::schema::scope_requirement_t>& required,
    const std::vector<hap::schema::decision_owner_scope_t>& scopes,
    const std::vector<hap::schema::scope_substitution_t>& substitutions);

coverage_t path_coverage(
    const hap::schema::profile_t& profile,
    const hap::schema::execution_path_t& path,
    const std::vector<hap::schema::decision_owner_scope_t>& scopes);

std::string describe(const hap::schema::scope_requirement_t& requirement);

/// `scope_insufficient` naming every missing requirement, or ok.
hap::schema::status_t to_status(const coverage_t& coverage);

}  // namespace hap::scope
