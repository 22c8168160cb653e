#pragma once

#include <hap/crypto/key_registry.hpp>
#include <hap/frame/canonical.hpp>
#include <hap/schema/primitives.hpp>
#include <hap/schema/result.hpp>

#include <string>
#include <vector>

namespace hap::execution {

struct authorization_request_t final {
  // Every attestation blob collected for the change.
  std::vector<std::string> blobs;
  // Frame parameters as the executor sees them. The Frame hash is always
  // recomputed from these, never taken from the client.
  hap::frame::frame_fields_t frame;
  std::string expected_profile_id;
};

struct authorized_scope_t final {
  std::string domain;
  std::string did;
  std::string env;
};

/// What the execution backend is told. Only structural facts: nothing that
/// was hashed rather than disclosed ever appears here.
struct authorization_t final {
  std::vector<hap::schema::content_hash_t> attestation_ids;
  hap::schema::content_hash_t frame_hash;
  std::string profile_id;
  std::string execution_path;
  std::vector<authorized_scope_t> scopes;
  hap::schema::timestamp_seconds_t valid_from{};
  hap::schema::timestamp_seconds_t valid_until{};
};

/// Blind executor gate.
///
/// Verifies every attestation against the published keys and the Frame it
/// recomputes itself, then requires the union of attested scopes to cover
/// the execution path the Frame names.
class authorizer final {
 public:
  explicit authorizer(const hap::crypto::key_registry& keys);

  /// Authorize `request` at time `now`.
  ///
  /// Fails with the first failing check's code: `unknown_profile`,
  /// `validation_error` (bad Frame), `unknown_execution_path`,
  /// `malformed_attestation`, `invalid_signature`, `expired`,
  /// `profile_mismatch`, `frame_mismatch` or `scope_insufficient`.
  hap::schema::result<authorization_t> authorize(
      const authorization_request_t& request,
      hap::schema::timestamp_seconds_t now) const;

 private:
  const hap::crypto::key_registry& keys_;
};

}  // namespace hap::execution
