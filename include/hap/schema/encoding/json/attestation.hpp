#pragma once
#include <hap/schema/attestation.hpp>

#include <nlohmann/json.hpp>

// Attestation JSON. Member order is part of the wire format: the signature
// covers the exact payload bytes, and verifiers re-encode decoded payloads.
namespace hap::schema {

void to_json(nlohmann::ordered_json& j, const attestation_header_t& o);
void from_json(const nlohmann::ordered_json& j, attestation_header_t& o);

void to_json(nlohmann::ordered_json& j, const decision_owner_scope_t& o);
void from_json(const nlohmann::ordered_json& j, decision_owner_scope_t& o);

void to_json(nlohmann::ordered_json& j, const resolved_domain_t& o);
void from_json(const nlohmann::ordered_json& j, resolved_domain_t& o);

void to_json(nlohmann::ordered_json& j, const attestation_payload<2>& o);
void from_json(const nlohmann::ordered_json& j, attestation_payload<2>& o);

void to_json(nlohmann::ordered_json& j, const attestation_payload<3>& o);
void from_json(const nlohmann::ordered_json& j, attestation_payload<3>& o);

void to_json(nlohmann::ordered_json& j, const attestation_payload_t& o);
void from_json(const nlohmann::ordered_json& j, attestation_payload_t& o);

void to_json(nlohmann::ordered_json& j, const attestation_t& o);
void from_json(const nlohmann::ordered_json& j, attestation_t& o);

}  // namespace hap::schema
