#pragma once

#include <hap/crypto/key_registry.hpp>
#include <hap/frame/canonical.hpp>
#include <hap/schema/attestation.hpp>
#include <hap/schema/result.hpp>

#include <string_view>

namespace hap::attestation {

struct verified_attestation_t final {
  hap::schema::attestation_t attestation;
  hap::schema::content_hash_t attestation_id;
};

/// Step 1. Fails with `malformed_attestation`.
hap::schema::result<hap::schema::attestation_t> decode(std::string_view blob);

/// Step 2. Fails with `invalid_signature`.
hap::schema::status_t verify_signature(
    const hap::schema::attestation_t& attestation,
    const hap::schema::ed25519_public_key_t& public_key);

/// Step 2 against the key published under the header's key id. An unknown
/// key id fails with `invalid_signature`.
hap::schema::status_t verify_signature(
    const hap::schema::attestation_t& attestation,
    const hap::crypto::key_registry& keys);

/// Step 3. `expires_at <= now` fails with `expired`.
hap::schema::status_t check_expiry(const hap::schema::attestation_t& attestation,
                                   hap::schema::timestamp_seconds_t now);

/// Step 4. Fails with `frame_mismatch`.
hap::schema::status_t check_frame_hash(
    const hap::schema::attestation_t& attestation,
    const hap::schema::content_hash_t& expected_frame_hash);

/// Recompute the Frame hash under the payload's own profile and compare.
hap::schema::status_t check_frame(const hap::schema::attestation_t& attestation,
                                  const hap::frame::frame_fields_t& frame);

/// Steps 1 to 4 in order, stopping at the first failure.
hap::schema::result<verified_attestation_t> verify(
    std::string_view blob,
    const hap::frame::frame_fields_t& frame,
    const hap::crypto::key_registry& keys,
    hap::schema::timestamp_seconds_t now);

}  // namespace hap::attestation
