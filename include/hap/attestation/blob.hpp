#pragma once

#include <hap/schema/attestation.hpp>
#include <hap/schema/primitives.hpp>
#include <hap/schema/result.hpp>

#include <string>
#include <string_view>

namespace hap::attestation {

/// Compact payload JSON; the exact bytes covered by the signature.
std::string signing_bytes(const hap::schema::attestation_payload_t& payload);

/// URL-safe base64 (no padding) of the attestation JSON.
std::string encode_blob(const hap::schema::attestation_t& attestation);

/// Fails with `malformed_attestation` on bad base64, bad JSON, a missing
/// field, or an unexpected header type or algorithm.
hap::schema::result<hap::schema::attestation_t> decode_blob(
    std::string_view blob);

/// Externally reported attestation id: the content hash of the blob text.
hap::schema::content_hash_t attestation_id(std::string_view blob);

/// Random RFC 4122 version 4 identifier for a new payload.
std::string make_uuid();

}  // namespace hap::attestation
