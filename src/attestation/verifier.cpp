#include <hap/attestation/blob.hpp>
#include <hap/attestation/verifier.hpp>
#include <hap/crypto/verify.hpp>
#include <hap/profile/registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.attestation.verifier";

hap::schema::error_t failure(const error_code code, std::string reason) {
  spdlog::warn("Attestation rejected ({}): {}", to_string(code), reason);
  return make_error(code, reason, {reason}, kCodespace);
}

}  // namespace

namespace hap::attestation {

result<attestation_t> decode(const std::string_view blob) {
  return decode_blob(blob);
}

status_t verify_signature(const attestation_t& attestation,
                          const ed25519_public_key_t& public_key) {
  auto raw = try_from_base64(attestation.signature);
  if (!raw || raw->size() != sizeof(ed25519_signature_t)) {
    return failure(error_code::invalid_signature,
                   "signature is not a base64 Ed25519 signature");
  }
  auto signature = ed25519_signature_t{};
  std::copy(std::begin(*raw), std::end(*raw), std::begin(signature));

  const auto bytes = signing_bytes(attestation.payload);
  if (!hap::crypto::verify_ed25519(make_bytes_view(bytes), public_key,
                                   signature)) {
    return failure(error_code::invalid_signature,
                   "signature does not match payload");
  }
  return ok_status();
}

status_t verify_signature(const attestation_t& attestation,
                          const hap::crypto::key_registry& keys) {
  auto key = keys.find(attestation.header.kid);
  if (!key) {
    return failure(error_code::invalid_signature,
                   "unknown key id '" + attestation.header.kid + "'");
  }
  return verify_signature(attestation, *key);
}

status_t check_expiry(const attestation_t& attestation,
                      const timestamp_seconds_t now) {
  const auto summary = summarize(attestation.payload);
  if (summary.expires_at <= now) {
    return failure(error_code::expired,
                   "attestation expired at " +
                       std::to_string(summary.expires_at) + " (now " +
                       std::to_string(now) + ")");
  }
  return ok_status();
}

status_t check_frame_hash(const attestation_t& attestation,
                          const content_hash_t& expected_frame_hash) {
  const auto summary = summarize(attestation.payload);
  if (summary.frame_hash != expected_frame_hash) {
    return failure(error_code::frame_mismatch,
                   "attestation is bound to " + std::string{summary.frame_hash} +
                       ", expected " + expected_frame_hash);
  }
  return ok_status();
}

status_t check_frame(const attestation_t& attestation,
                     const hap::frame::frame_fields_t& frame) {
  const auto summary = summarize(attestation.payload);
  auto profile = hap::profile::resolve_profile(summary.profile_id);
  if (!profile) {
    return profile.error();
  }
  auto expected = hap::frame::compute_frame_hash(frame, *profile.value());
  if (!expected) {
    return expected.error();
  }
  return check_frame_hash(attestation, expected.value());
}

result<verified_attestation_t> verify(const std::string_view blob,
                                      const hap::frame::frame_fields_t& frame,
                                      const hap::crypto::key_registry& keys,
                                      const timestamp_seconds_t now) {
  auto attestation = decode(blob);
  if (!attestation) {
    return attestation.error();
  }
  if (auto status = verify_signature(attestation.value(), keys); !status) {
    return status.error();
  }
  if (auto status = check_expiry(attestation.value(), now); !status) {
    return status.error();
  }
  if (auto status = check_frame(attestation.value(), frame); !status) {
    return status.error();
  }
  return verified_attestation_t{.attestation = std::move(attestation).value(),
                                .attestation_id = attestation_id(blob)};
}

}  // namespace hap::attestation
