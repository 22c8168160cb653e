#include <hap/attestation/blob.hpp>
#include <hap/attestation/signer.hpp>
#include <hap/profile/registry.hpp>
#include <hap/scope/satisfier.hpp>
#include <hap/schema/environment.hpp>
#include <hap/sha256/hash.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <tuple>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.attestation.signer";

using hap::attestation::request_violations_t;
using hap::attestation::sign_request;
using hap::attestation::sign_request_t;

void check_text(const std::string_view what,
                const std::string_view value,
                std::vector<std::string>& violations) {
  if (!is_valid_utf8(value)) {
    violations.push_back(std::string{what} + " is not valid UTF-8");
  }
}

void check_owner(const std::string_view did,
                 const std::string_view domain,
                 const std::string_view env,
                 const profile_t& profile,
                 std::vector<std::string>& violations) {
  check_text("decision owner did", did, violations);
  if (did.empty()) {
    violations.push_back("decision owner for domain " + std::string{domain} +
                         " has no did");
  }
  if (hap::profile::find_domain_schema(profile, domain) == nullptr) {
    violations.push_back("domain \"" + std::string{domain} +
                         "\" not defined in profile " + profile.id);
  }
  if (!try_from_string<environment_t>(env)) {
    violations.push_back("invalid env \"" + std::string{env} +
                         "\" for domain " + std::string{domain});
  }
}

void check_request(const sign_request<2>& request,
                   const profile_t& profile,
                   const execution_path_t& path,
                   request_violations_t& violations) {
  for (const auto& gate : profile.required_gates) {
    if (std::ranges::find(request.resolved_gates, gate) ==
        std::end(request.resolved_gates)) {
      violations.missing_gates.push_back("missing gate: " + gate);
    }
  }
  for (const auto& gate : request.resolved_gates) {
    check_text("resolved gate", gate, violations.validation);
  }
  if (request.decision_owners.empty()) {
    violations.validation.emplace_back("at least one decision owner required");
  }
  for (const auto& owner : request.decision_owners) {
    check_text("decision owner", owner, violations.validation);
  }
  for (const auto& scope : request.decision_owner_scopes) {
    check_owner(scope.did, scope.domain, scope.env, profile,
                violations.validation);
  }

  const auto coverage =
      hap::scope::path_coverage(profile, path, request.decision_owner_scopes);
  if (coverage.no_attestations) {
    violations.scope.emplace_back("no decision owner scopes supplied");
  }
  for (const auto& missing : coverage.missing) {
    violations.scope.push_back("missing scope: " +
                               hap::scope::describe(missing));
  }
}

void check_request(const sign_request<3>& request,
                   const profile_t& profile,
                   const execution_path_t&,
                   request_violations_t& violations) {
  if (request.resolved_domains.empty()) {
    violations.validation.emplace_back("at least one resolved domain required");
  }
  auto seen = std::set<std::string>{};
  for (const auto& resolved : request.resolved_domains) {
    check_owner(resolved.did, resolved.domain, resolved.env, profile,
                violations.validation);
    if (!hap::sha256::is_content_hash(resolved.disclosure_hash)) {
      violations.validation.push_back("invalid disclosure_hash for domain " +
                                      resolved.domain);
    }
    if (!seen.insert(resolved.domain).second) {
      violations.validation.push_back("domain " + resolved.domain +
                                      " resolved more than once");
    }
  }
}

attestation_payload_t make_payload(const sign_request<2>& request,
                                   const timestamp_seconds_t now,
                                   const duration_seconds_t ttl) {
  return attestation_payload<2>{
      .attestation_id = hap::attestation::make_uuid(),
      .profile_id = request.profile_id,
      .frame_hash = request.frame_hash,
      .resolved_gates = request.resolved_gates,
      .decision_owners = request.decision_owners,
      .decision_owner_scopes = request.decision_owner_scopes,
      .issued_at = now,
      .expires_at = now + ttl};
}

attestation_payload_t make_payload(const sign_request<3>& request,
                                   const timestamp_seconds_t now,
                                   const duration_seconds_t ttl) {
  return attestation_payload<3>{
      .attestation_id = hap::attestation::make_uuid(),
      .profile_id = request.profile_id,
      .frame_hash = request.frame_hash,
      .resolved_domains = request.resolved_domains,
      .issued_at = now,
      .expires_at = now + ttl};
}

protocol_version_t protocol_of(const sign_request_t& request) {
  return std::holds_alternative<sign_request<3>>(request)
             ? protocol_version_t::v0_3
             : protocol_version_t::v0_2;
}

hap::schema::error_t reject(request_violations_t violations) {
  auto code = error_code::validation_error;
  if (violations.validation.empty()) {
    if (!violations.missing_gates.empty()) {
      code = error_code::missing_gates;
    } else if (!violations.scope.empty()) {
      code = error_code::scope_insufficient;
    } else {
      code = error_code::ttl_exceeded;
    }
  }

  auto all = std::vector<std::string>{};
  for (auto* group : {&violations.validation, &violations.missing_gates,
                      &violations.scope, &violations.ttl}) {
    std::ranges::move(*group, std::back_inserter(all));
  }
  auto log = std::string{"attestation request rejected: "} + all.front();
  if (all.size() > 1) {
    log += " (and " + std::to_string(all.size() - 1) + " more)";
  }
  spdlog::warn("{}", log);
  return make_error(code, std::move(log), std::move(all), kCodespace);
}

}  // namespace

namespace hap::attestation {

result<signed_attestation_t> sign(const sign_request_t& request,
                                  const hap::crypto::signing_context& context,
                                  const timestamp_seconds_t now) {
  const auto& [profile_id, path_id, frame_hash, ttl] = std::visit(
      [](const auto& r) {
        return std::tuple<std::string_view, std::string_view, std::string_view,
                          std::optional<duration_seconds_t>>{
            r.profile_id, r.execution_path, r.frame_hash, r.ttl};
      },
      request);

  auto profile_result = hap::profile::resolve_profile(profile_id);
  if (!profile_result) {
    return profile_result.error();
  }
  const auto& profile = *profile_result.value();

  auto path_result = hap::profile::resolve_execution_path(profile, path_id);
  if (!path_result) {
    return path_result.error();
  }
  const auto& path = *path_result.value();

  auto violations = request_violations_t{};
  if (profile.protocol != protocol_of(request)) {
    violations.validation.push_back("profile " + profile.id +
                                    " does not accept this payload version");
  }
  if (!hap::sha256::is_content_hash(frame_hash)) {
    violations.validation.push_back("invalid frame_hash \"" +
                                    std::string{frame_hash} + "\"");
  }

  check_text("key id", context.kid(), violations.validation);

  const auto lifetime = ttl.value_or(profile.ttl.default_ttl);
  if (lifetime <= 0) {
    violations.validation.push_back("ttl must be positive");
  } else if (lifetime > profile.ttl.max_ttl) {
    violations.ttl.push_back("ttl " + std::to_string(lifetime) +
                             " exceeds profile maximum " +
                             std::to_string(profile.ttl.max_ttl));
  } else if (now > std::numeric_limits<timestamp_seconds_t>::max() - lifetime) {
    violations.validation.push_back("issued_at " + std::to_string(now) +
                                    " leaves no room for a ttl of " +
                                    std::to_string(lifetime));
  }

  std::visit([&](const auto& r) { check_request(r, profile, path, violations); },
             request);

  if (!violations.validation.empty() || !violations.missing_gates.empty() ||
      !violations.scope.empty() || !violations.ttl.empty()) {
    return reject(std::move(violations));
  }

  auto payload = std::visit(
      [&](const auto& r) { return make_payload(r, now, lifetime); }, request);
  const auto bytes = signing_bytes(payload);
  const auto signature = context.sign(make_bytes_view(bytes));

  auto out = signed_attestation_t{};
  out.attestation = attestation_t{
      .header = attestation_header_t{.kid = context.kid()},
      .payload = std::move(payload),
      .signature = to_base64(bytes_view_t{signature.data(), signature.size()})};
  out.blob = encode_blob(out.attestation);
  out.attestation_id = attestation_id(out.blob);

  spdlog::info("Issued attestation {} for {} path {} (expires_at={})",
               out.attestation_id, profile.id, path_id, now + lifetime);
  return out;
}

}  // namespace hap::attestation
