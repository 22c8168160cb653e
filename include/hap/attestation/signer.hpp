#pragma once

#include <hap/crypto/signing_context.hpp>
#include <hap/schema/attestation.hpp>
#include <hap/schema/result.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hap::attestation {

template <uint16_t Version>
struct sign_request;

template <>
struct sign_request<2> final {
  std::string profile_id;
  std::string execution_path;
  hap::schema::content_hash_t frame_hash;
  std::vector<std::string> resolved_gates;
  std::vector<std::string> decision_owners;
  std::vector<hap::schema::decision_owner_scope_t> decision_owner_scopes;
  // Profile default when unset.
  std::optional<hap::schema::duration_seconds_t> ttl;
};

template <>
struct sign_request<3> final {
  std::string profile_id;
  std::string execution_path;
  hap::schema::content_hash_t frame_hash;
  std::vector<hap::schema::resolved_domain_t> resolved_domains;
  std::optional<hap::schema::duration_seconds_t> ttl;
};

using sign_request_v02_t = sign_request<2>;
using sign_request_v03_t = sign_request<3>;
using sign_request_t = std::variant<sign_request_v02_t, sign_request_v03_t>;

struct signed_attestation_t final {
  hap::schema::attestation_t attestation;
  std::string blob;
  hap::schema::content_hash_t attestation_id;
};

/// Every violation in `request`, grouped by the error code it maps to. The
/// first non-empty group in declaration order decides the reported code.
struct request_violations_t final {
  std::vector<std::string> validation;
  std::vector<std::string> missing_gates;
  std::vector<std::string> scope;
  std::vector<std::string> ttl;
};

/// Issue an attestation for `request` at time `now`.
///
/// Fails with `unknown_profile`, `unknown_execution_path`,
/// `validation_error`, `missing_gates`, `scope_insufficient` or
/// `ttl_exceeded`. Every violation found is listed, whatever the code.
hap::schema::result<signed_attestation_t> sign(
    const sign_request_t& request,
    const hap::crypto::signing_context& context,
    hap::schema::timestamp_seconds_t now);

}  // namespace hap::attestation
