#include <hap/attestation/blob.hpp>
#include <hap/attestation/verifier.hpp>
#include <hap/execution/authorizer.hpp>
#include <hap/profile/registry.hpp>
#include <hap/scope/satisfier.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.execution";

// Scopes an attestation speaks for. v0.2 carries decision-owner scopes,
// v0.3 one entry per resolved domain.
std::vector<decision_owner_scope_t> attested_scopes(
    const attestation_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const attestation_payload<2>& p) {
            return p.decision_owner_scopes;
          },
          [](const attestation_payload<3>& p) {
            auto scopes = std::vector<decision_owner_scope_t>{};
            scopes.reserve(p.resolved_domains.size());
            for (const auto& resolved : p.resolved_domains) {
              scopes.push_back(decision_owner_scope_t{.did = resolved.did,
                                                      .domain = resolved.domain,
                                                      .env = resolved.env});
            }
            return scopes;
          },
      },
      payload);
}

}  // namespace

namespace hap::execution {

authorizer::authorizer(const hap::crypto::key_registry& keys) : keys_{keys} {}

result<authorization_t> authorizer::authorize(
    const authorization_request_t& request,
    const timestamp_seconds_t now) const {
  auto profile_result =
      hap::profile::resolve_profile(request.expected_profile_id);
  if (!profile_result) {
    return profile_result.error();
  }
  const auto& profile = *profile_result.value();

  auto frame_hash = hap::frame::compute_frame_hash(request.frame, profile);
  if (!frame_hash) {
    return frame_hash.error();
  }

  const auto path_field = request.frame.find("path");
  const auto path_id = path_field == std::end(request.frame)
                           ? std::string{}
                           : path_field->second;
  auto path_result = hap::profile::resolve_execution_path(profile, path_id);
  if (!path_result) {
    return path_result.error();
  }
  const auto& path = *path_result.value();

  auto out = authorization_t{.frame_hash = frame_hash.value(),
                             .profile_id = profile.id,
                             .execution_path = path_id};
  auto scopes = std::vector<decision_owner_scope_t>{};
  for (const auto& blob : request.blobs) {
    auto attestation = hap::attestation::decode(blob);
    if (!attestation) {
      return attestation.error();
    }
    const auto& value = attestation.value();
    if (auto status = hap::attestation::verify_signature(value, keys_);
        !status) {
      return status.error();
    }
    if (auto status = hap::attestation::check_expiry(value, now); !status) {
      return status.error();
    }

    const auto summary = summarize(value.payload);
    if (summary.profile_id != profile.id) {
      spdlog::warn("Attestation for profile {} presented for {}",
                   summary.profile_id, profile.id);
      return make_error(error_code::profile_mismatch,
                        "attestation profile " +
                            std::string{summary.profile_id} +
                            " does not match expected " + profile.id,
                        {}, kCodespace);
    }
    if (auto status =
            hap::attestation::check_frame_hash(value, frame_hash.value());
        !status) {
      return status.error();
    }

    auto attested = attested_scopes(value.payload);
    scopes.insert(std::end(scopes), std::begin(attested), std::end(attested));
    out.attestation_ids.push_back(hap::attestation::attestation_id(blob));
    out.valid_from = out.attestation_ids.size() == 1
                         ? summary.issued_at
                         : std::max(out.valid_from, summary.issued_at);
    out.valid_until = out.attestation_ids.size() == 1
                          ? summary.expires_at
                          : std::min(out.valid_until, summary.expires_at);
  }

  auto coverage = hap::scope::path_coverage(profile, path, scopes);
  if (auto status = hap::scope::to_status(coverage); !status) {
    spdlog::warn("Execution of {} refused: {}", path_id, status.error().log);
    return status.error();
  }

  for (const auto& scope : scopes) {
    out.scopes.push_back(authorized_scope_t{
        .domain = scope.domain, .did = scope.did, .env = scope.env});
  }
  const auto key = [](const authorized_scope_t& s) {
    return std::tie(s.domain, s.did, s.env);
  };
  std::ranges::sort(out.scopes, [&](const authorized_scope_t& lhs,
                                    const authorized_scope_t& rhs) {
    return key(lhs) < key(rhs);
  });
  auto duplicates = std::ranges::unique(
      out.scopes, [&](const authorized_scope_t& lhs,
                      const authorized_scope_t& rhs) {
        return key(lhs) == key(rhs);
      });
  out.scopes.erase(std::begin(duplicates), std::end(duplicates));

  spdlog::info("Authorized {} on {} with {} attestation(s)", path_id,
               out.frame_hash, out.attestation_ids.size());
  return out;
}

}  // namespace hap::execution
