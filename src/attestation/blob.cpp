#include <hap/attestation/blob.hpp>
#include <hap/common/critical.hpp>
#include <hap/schema/encoding/json/encoder.hpp>
#include <hap/sha256/hash.hpp>

#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.attestation";

hap::schema::error_t malformed(std::string reason) {
  spdlog::warn("Malformed attestation: {}", reason);
  return make_error(error_code::malformed_attestation,
                    "malformed attestation: " + reason, {reason}, kCodespace);
}

}  // namespace

namespace hap::attestation {

std::string signing_bytes(const attestation_payload_t& payload) {
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  return encoder.encode(payload);
}

std::string encode_blob(const attestation_t& attestation) {
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  return to_base64url(make_bytes_view(encoder.encode(attestation)));
}

result<attestation_t> decode_blob(const std::string_view blob) {
  auto bytes = try_from_base64url(blob);
  if (!bytes) {
    return malformed("blob is not valid base64url");
  }

  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  auto error = std::string{};
  auto attestation =
      encoder.try_decode<attestation_t>(make_string_view(*bytes), error);
  if (!attestation) {
    return malformed(error);
  }
  if (attestation->header.typ != kAttestationType) {
    return malformed("unexpected header typ '" + attestation->header.typ +
                     "'");
  }
  if (attestation->header.alg != kAttestationAlgorithm) {
    return malformed("unsupported header alg '" + attestation->header.alg +
                     "'");
  }
  return std::move(*attestation);
}

content_hash_t attestation_id(const std::string_view blob) {
  return hap::sha256::content_hash(blob);
}

std::string make_uuid() {
  auto bytes = std::array<uint8_t, 16>{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    hap::common::critical("RAND_bytes failed while minting attestation id");
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

  auto hex = to_hex(bytes_view_t{bytes.data(), bytes.size()});
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

}  // namespace hap::attestation
