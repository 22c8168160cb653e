#pragma once
#include <hap/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: attestation.
// A signed statement from the signing authority that accountable humans
// approved one exact Frame. Immutable once issued.
namespace hap::schema {

inline constexpr auto kAttestationType = std::string_view{"HAP-attestation"};
inline constexpr auto kAttestationAlgorithm = std::string_view{"EdDSA"};

struct attestation_header_t final {
  std::string typ{kAttestationType};
  std::string alg{kAttestationAlgorithm};
  std::string kid;
};

struct decision_owner_scope_t final {
  std::string did;
  std::string domain;
  std::string env;
};

struct resolved_domain_t final {
  std::string domain;
  std::string did;
  std::string env;
  content_hash_t disclosure_hash;
};

template <uint16_t Version>
struct attestation_payload;

// deploy-gate@0.2: one aggregate disclosure hash, bound through the Frame.
template <>
struct attestation_payload<2> final {
  static constexpr auto kVersion = std::string_view{"0.2"};
  std::string attestation_id;
  std::string profile_id;
  content_hash_t frame_hash;
  std::vector<std::string> resolved_gates;
  std::vector<std::string> decision_owners;
  std::vector<decision_owner_scope_t> decision_owner_scopes;
  timestamp_seconds_t issued_at{};
  timestamp_seconds_t expires_at{};
};

// deploy-gate@0.3: each domain carries its own disclosure hash.
template <>
struct attestation_payload<3> final {
  static constexpr auto kVersion = std::string_view{"0.3"};
  std::string attestation_id;
  std::string profile_id;
  content_hash_t frame_hash;
  std::vector<resolved_domain_t> resolved_domains;
  timestamp_seconds_t issued_at{};
  timestamp_seconds_t expires_at{};
};

using attestation_payload_v02_t = attestation_payload<2>;
using attestation_payload_v03_t = attestation_payload<3>;
using attestation_payload_t =
    std::variant<attestation_payload_v02_t, attestation_payload_v03_t>;

struct attestation_t final {
  attestation_header_t header;
  attestation_payload_t payload;
  // Standard base64 of the Ed25519 signature over the payload JSON.
  std::string signature;
};

// Fields shared by both payload versions.
struct payload_summary_t final {
  std::string_view version;
  std::string_view attestation_id;
  std::string_view profile_id;
  std::string_view frame_hash;
  timestamp_seconds_t issued_at{};
  timestamp_seconds_t expires_at{};
};

inline payload_summary_t summarize(const attestation_payload_t& payload) {
  return std::visit(
      [](const auto& value) {
        return payload_summary_t{.version = value.kVersion,
                                 .attestation_id = value.attestation_id,
                                 .profile_id = value.profile_id,
                                 .frame_hash = value.frame_hash,
                                 .issued_at = value.issued_at,
                                 .expires_at = value.expires_at};
      },
      payload);
}

}  // namespace hap::schema
