#include <hap/schema/encoding/json/attestation.hpp>

namespace hap::schema {

void to_json(nlohmann::ordered_json& j, const attestation_header_t& o) {
  j = nlohmann::ordered_json{{"typ", o.typ}, {"alg", o.alg}, {"kid", o.kid}};
}

void from_json(const nlohmann::ordered_json& j, attestation_header_t& o) {
  j.at("typ").get_to(o.typ);
  j.at("alg").get_to(o.alg);
  j.at("kid").get_to(o.kid);
}

void to_json(nlohmann::ordered_json& j, const decision_owner_scope_t& o) {
  j = nlohmann::ordered_json{
      {"did", o.did}, {"domain", o.domain}, {"env", o.env}};
}

void from_json(const nlohmann::ordered_json& j, decision_owner_scope_t& o) {
  j.at("did").get_to(o.did);
  j.at("domain").get_to(o.domain);
  j.at("env").get_to(o.env);
}

void to_json(nlohmann::ordered_json& j, const resolved_domain_t& o) {
  j = nlohmann::ordered_json{{"domain", o.domain},
                             {"did", o.did},
                             {"env", o.env},
                             {"disclosure_hash", o.disclosure_hash}};
}

void from_json(const nlohmann::ordered_json& j, resolved_domain_t& o) {
  j.at("domain").get_to(o.domain);
  j.at("did").get_to(o.did);
  j.at("env").get_to(o.env);
  j.at("disclosure_hash").get_to(o.disclosure_hash);
}

void to_json(nlohmann::ordered_json& j, const attestation_payload<2>& o) {
  j = nlohmann::ordered_json{{"attestation_id", o.attestation_id},
                             {"version", std::string{o.kVersion}},
                             {"profile_id", o.profile_id},
                             {"frame_hash", o.frame_hash},
                             {"resolved_gates", o.resolved_gates},
                             {"decision_owners", o.decision_owners},
                             {"decision_owner_scopes", o.decision_owner_scopes},
                             {"issued_at", o.issued_at},
                             {"expires_at", o.expires_at}};
}

void from_json(const nlohmann::ordered_json& j, attestation_payload<2>& o) {
  j.at("attestation_id").get_to(o.attestation_id);
  j.at("profile_id").get_to(o.profile_id);
  j.at("frame_hash").get_to(o.frame_hash);
  j.at("resolved_gates").get_to(o.resolved_gates);
  j.at("decision_owners").get_to(o.decision_owners);
  // Early v0.2 attestations predate per-domain scopes.
  if (j.contains("decision_owner_scopes")) {
    j.at("decision_owner_scopes").get_to(o.decision_owner_scopes);
  }
  j.at("issued_at").get_to(o.issued_at);
  j.at("expires_at").get_to(o.expires_at);
}

void to_json(nlohmann::ordered_json& j, const attestation_payload<3>& o) {
  j = nlohmann::ordered_json{{"attestation_id", o.attestation_id},
                             {"version", std::string{o.kVersion}},
                             {"profile_id", o.profile_id},
                             {"frame_hash", o.frame_hash},
                             {"resolved_domains", o.resolved_domains},
                             {"issued_at", o.issued_at},
                             {"expires_at", o.expires_at}};
}

void from_json(const nlohmann::ordered_json& j, attestation_payload<3>& o) {
  j.at("attestation_id").get_to(o.attestation_id);
  j.at("profile_id").get_to(o.profile_id);
  j.at("frame_hash").get_to(o.frame_hash);
  j.at("resolved_domains").get_to(o.resolved_domains);
  j.at("issued_at").get_to(o.issued_at);
  j.at("expires_at").get_to(o.expires_at);
}

void to_json(nlohmann::ordered_json& j, const attestation_payload_t& o) {
  std::visit([&](const auto& payload) { to_json(j, payload); }, o);
}

void from_json(const nlohmann::ordered_json& j, attestation_payload_t& o) {
  const auto version = j.at("version").get<std::string>();
  if (version == attestation_payload<3>::kVersion) {
    o = j.get<attestation_payload<3>>();
  } else if (version == attestation_payload<2>::kVersion) {
    o = j.get<attestation_payload<2>>();
  } else {
    throw nlohmann::ordered_json::other_error::create(
        501, "unsupported attestation version '" + version + "'", &j);
  }
}

void to_json(nlohmann::ordered_json& j, const attestation_t& o) {
  j = nlohmann::ordered_json{{"header", o.header},
                             {"payload", o.payload},
                             {"signature", o.signature}};
}

void from_json(const nlohmann::ordered_json& j, attestation_t& o) {
  j.at("header").get_to(o.header);
  j.at("payload").get_to(o.payload);
  j.at("signature").get_to(o.signature);
}

}  // namespace hap::schema
