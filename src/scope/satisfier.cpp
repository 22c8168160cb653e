#include <hap/scope/satisfier.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.scope";

// `covers(domain, env)` answers whether any attestation speaks for that
// domain in that environment.
template <typename Covers>
hap::scope::coverage_t match(const std::vector<scope_requirement_t>& required,
                             const std::vector<scope_substitution_t>& substitutions,
                             Covers covers) {
  auto coverage = hap::scope::coverage_t{};
  for (const auto& requirement : required) {
    if (covers(requirement.domain, requirement.env)) {
      continue;
    }
    auto substitute = std::ranges::find_if(
        substitutions, [&](const scope_substitution_t& substitution) {
          return substitution.required_domain == requirement.domain &&
                 covers(substitution.substitute_domain, requirement.env);
        });
    if (substitute != std::end(substitutions)) {
      coverage.substitutions_applied.push_back(*substitute);
      continue;
    }
    coverage.missing.push_back(requirement);
  }
  return coverage;
}

}  // namespace

namespace hap::scope {

coverage_t domain_coverage(const std::vector<std::string>& required_domains,
                           const std::set<std::string>& attested_domains,
                           const std::vector<scope_substitution_t>& substitutions) {
  auto required = std::vector<scope_requirement_t>{};
  required.reserve(required_domains.size());
  for (const auto& domain : required_domains) {
    required.push_back(scope_requirement_t{.domain = domain});
  }

  auto coverage = match(required, substitutions,
                        [&](const std::string& domain, const std::string&) {
                          return attested_domains.contains(domain);
                        });
  coverage.no_attestations = attested_domains.empty();
  return coverage;
}

coverage_t scope_coverage(const std::vector<scope_requirement_t>& required,
                          const std::vector<decision_owner_scope_t>& scopes,
                          const std::vector<scope_substitution_t>& substitutions) {
  auto coverage = match(
      required, substitutions,
      [&](const std::string& domain, const std::string& env) {
        return std::ranges::any_of(scopes, [&](const decision_owner_scope_t& s) {
          return s.domain == domain && (env.empty() || s.env == env);
        });
      });
  coverage.no_attestations = scopes.empty();
  return coverage;
}

coverage_t path_coverage(const profile_t& profile,
                         const execution_path_t& path,
                         const std::vector<decision_owner_scope_t>& scopes) {
  if (!path.required_scopes.empty()) {
    return scope_coverage(path.required_scopes, scopes, profile.substitutions);
  }
  auto attested = std::set<std::string>{};
  for (const auto& scope : scopes) {
    attested.insert(scope.domain);
  }
  return domain_coverage(path.required_domains, attested,
                         profile.substitutions);
}

std::string describe(const scope_requirement_t& requirement) {
  if (requirement.env.empty()) {
    return requirement.domain;
  }
  return requirement.domain + "@" + requirement.env;
}

status_t to_status(const coverage_t& coverage) {
  if (coverage.satisfied()) {
    for (const auto& substitution : coverage.substitutions_applied) {
      spdlog::debug("Requirement {} satisfied by substitute {}",
                    substitution.required_domain,
                    substitution.substitute_domain);
    }
    return ok_status();
  }

  auto violations = std::vector<std::string>{};
  if (coverage.no_attestations) {
    violations.emplace_back("no attestations collected");
  }
  for (const auto& requirement : coverage.missing) {
    violations.push_back("missing attestation for " + describe(requirement));
  }
  auto log = std::string{"scope insufficient"};
  if (!coverage.missing.empty()) {
    log += ": missing " + describe(coverage.missing.front());
    for (auto it = std::next(std::begin(coverage.missing));
         it != std::end(coverage.missing); ++it) {
      log += ", " + describe(*it);
    }
  }
  return make_error(error_code::scope_insufficient, std::move(log),
                    std::move(violations), kCodespace);
}

}  // namespace hap::scope
