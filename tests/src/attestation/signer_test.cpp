#include <gtest/gtest.h>
#include <hap/attestation/blob.hpp>
#include <hap/attestation/signer.hpp>
#include <hap/attestation/verifier.hpp>
#include <hap/frame/canonical.hpp>
#include <hap/profile/registry.hpp>
#include <hap/testing/common.hpp>

#include <algorithm>
#include <limits>
#include <regex>

namespace {

constexpr auto kEngineeringHash =
    "sha256:b635c314bf808d8b4ee85add5e35e236e487d32a6435a54c7f12164a3037f3c8";

hap::schema::content_hash_t frame_hash_v03(
    const std::string_view path = hap::testing::kCanaryPath) {
  return hap::frame::compute_frame_hash(
             hap::frame::make_frame_fields(hap::testing::make_frame_v03(path)),
             hap::profile::deploy_gate_v03())
      .value();
}

hap::attestation::sign_request<3> make_v03_request() {
  return hap::attestation::sign_request<3>{
      .profile_id = "deploy-gate@0.3",
      .execution_path = "deploy-prod-canary",
      .frame_hash = frame_hash_v03(),
      .resolved_domains = {hap::schema::resolved_domain_t{
          .domain = "engineering",
          .did = "did:web:alice.example",
          .env = "prod",
          .disclosure_hash = kEngineeringHash}}};
}

hap::attestation::sign_request<2> make_v02_request() {
  auto frame_hash = hap::frame::compute_frame_hash(
      hap::frame::make_frame_fields(hap::testing::make_frame_v02()),
      hap::profile::deploy_gate_v02());
  const auto& profile = hap::profile::deploy_gate_v02();
  return hap::attestation::sign_request<2>{
      .profile_id = "deploy-gate@0.2",
      .execution_path = "deploy-prod-canary",
      .frame_hash = frame_hash.value(),
      .resolved_gates = profile.required_gates,
      .decision_owners = {"did:web:alice.example"},
      .decision_owner_scopes = {hap::schema::decision_owner_scope_t{
          .did = "did:web:alice.example",
          .domain = "engineering",
          .env = "prod"}}};
}

bool mentions(const std::vector<std::string>& violations,
              const std::string_view needle) {
  return std::ranges::any_of(violations, [&](const std::string& violation) {
    return violation.find(needle) != std::string::npos;
  });
}

}  // namespace

TEST(attestation_signer, issues_v03_attestation_with_default_ttl) {
  auto context = hap::testing::make_signing_context();
  auto issued = hap::attestation::sign(make_v03_request(), context,
                                       hap::testing::kNow);
  ASSERT_TRUE(issued);

  const auto& attestation = issued.value().attestation;
  EXPECT_EQ(attestation.header.typ, "HAP-attestation");
  EXPECT_EQ(attestation.header.alg, "EdDSA");
  EXPECT_EQ(attestation.header.kid, "hap-sp-v1");

  const auto& payload =
      std::get<hap::schema::attestation_payload<3>>(attestation.payload);
  EXPECT_EQ(payload.issued_at, hap::testing::kNow);
  EXPECT_EQ(payload.expires_at, hap::testing::kNow + 3600);
  EXPECT_EQ(payload.frame_hash, frame_hash_v03());
  ASSERT_EQ(payload.resolved_domains.size(), 1u);
  EXPECT_EQ(payload.resolved_domains[0].disclosure_hash, kEngineeringHash);

  static const auto uuid_v4 = std::regex{
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$"};
  EXPECT_TRUE(std::regex_match(payload.attestation_id, uuid_v4));

  EXPECT_EQ(issued.value().attestation_id,
            hap::attestation::attestation_id(issued.value().blob));
  EXPECT_EQ(issued.value().blob.find_first_of("+/="), std::string::npos);
}

TEST(attestation_signer, signature_covers_payload_json) {
  auto context = hap::testing::make_signing_context();
  auto issued = hap::attestation::sign(make_v03_request(), context,
                                       hap::testing::kNow);
  ASSERT_TRUE(issued);
  const auto& attestation = issued.value().attestation;
  EXPECT_TRUE(
      hap::attestation::verify_signature(attestation, context.public_key()));

  auto tampered = attestation;
  std::get<hap::schema::attestation_payload<3>>(tampered.payload).expires_at +=
      1;
  auto status =
      hap::attestation::verify_signature(tampered, context.public_key());
  ASSERT_FALSE(status);
  EXPECT_EQ(status.code(), hap::schema::error_code::invalid_signature);
}

TEST(attestation_signer, attestation_ids_are_unique_per_issue) {
  auto context = hap::testing::make_signing_context();
  auto first = hap::attestation::sign(make_v03_request(), context,
                                      hap::testing::kNow);
  auto second = hap::attestation::sign(make_v03_request(), context,
                                       hap::testing::kNow);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_NE(first.value().blob, second.value().blob);
  EXPECT_NE(first.value().attestation_id, second.value().attestation_id);
}

TEST(attestation_signer, issues_v02_attestation_with_scopes) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v02_request();
  request.ttl = 600;
  auto issued =
      hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_TRUE(issued);
  const auto& payload = std::get<hap::schema::attestation_payload<2>>(
      issued.value().attestation.payload);
  EXPECT_EQ(payload.expires_at, hap::testing::kNow + 600);
  EXPECT_EQ(payload.decision_owner_scopes.size(), 1u);
  EXPECT_EQ(payload.resolved_gates.size(), 6u);
}

TEST(attestation_signer, rejects_ttl_above_profile_maximum) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v03_request();
  request.ttl = 86401;
  auto issued = hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(issued);
  EXPECT_EQ(issued.code(), hap::schema::error_code::ttl_exceeded);

  request.ttl = 86400;
  EXPECT_TRUE(hap::attestation::sign(request, context, hap::testing::kNow));

  request.ttl = 0;
  auto zero = hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(zero);
  EXPECT_EQ(zero.code(), hap::schema::error_code::validation_error);
}

TEST(attestation_signer, rejects_issue_time_that_would_overflow_expiry) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v03_request();
  request.ttl = 3600;
  const auto late =
      std::numeric_limits<hap::schema::timestamp_seconds_t>::max() - 10;
  auto issued = hap::attestation::sign(request, context, late);
  ASSERT_FALSE(issued);
  EXPECT_EQ(issued.code(), hap::schema::error_code::validation_error);
  EXPECT_TRUE(mentions(issued.error().violations, "leaves no room for a ttl"));

  const auto last =
      std::numeric_limits<hap::schema::timestamp_seconds_t>::max() - 3600;
  EXPECT_TRUE(hap::attestation::sign(request, context, last));
}

TEST(attestation_signer, rejects_identifiers_that_are_not_utf8) {
  auto context = hap::testing::make_signing_context();
  auto v03 = make_v03_request();
  v03.resolved_domains.front().did = "did:web:\xff" "alice.example";
  auto issued = hap::attestation::sign(v03, context, hap::testing::kNow);
  ASSERT_FALSE(issued);
  EXPECT_EQ(issued.code(), hap::schema::error_code::validation_error);
  EXPECT_TRUE(mentions(issued.error().violations,
                       "decision owner did is not valid UTF-8"));

  auto v02 = make_v02_request();
  v02.resolved_gates.push_back("gate\xc3");
  auto gates = hap::attestation::sign(v02, context, hap::testing::kNow);
  ASSERT_FALSE(gates);
  EXPECT_EQ(gates.code(), hap::schema::error_code::validation_error);
  EXPECT_TRUE(mentions(gates.error().violations,
                       "resolved gate is not valid UTF-8"));
}

TEST(attestation_signer, unknown_profile_and_path_short_circuit) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v03_request();
  request.profile_id = "deploy-gate@1.0";
  auto unknown_profile =
      hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(unknown_profile);
  EXPECT_EQ(unknown_profile.code(), hap::schema::error_code::unknown_profile);

  request = make_v03_request();
  request.execution_path = "deploy-dev";
  auto unknown_path =
      hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(unknown_path);
  EXPECT_EQ(unknown_path.code(),
            hap::schema::error_code::unknown_execution_path);
}

TEST(attestation_signer, v02_requires_every_gate) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v02_request();
  request.resolved_gates = {"frame", "problem"};
  auto issued = hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(issued);
  EXPECT_EQ(issued.code(), hap::schema::error_code::missing_gates);
  EXPECT_TRUE(mentions(issued.error().violations, "missing gate: objective"));
  EXPECT_TRUE(
      mentions(issued.error().violations, "missing gate: decision_owner"));
}

TEST(attestation_signer, v02_requires_path_scope_coverage) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v02_request();
  request.execution_path = "deploy-prod-full";
  auto issued = hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(issued);
  EXPECT_EQ(issued.code(), hap::schema::error_code::scope_insufficient);
  EXPECT_TRUE(mentions(issued.error().violations,
                       "missing scope: release_management@prod"));

  request.decision_owner_scopes.push_back(hap::schema::decision_owner_scope_t{
      .did = "did:web:sec.example", .domain = "security", .env = "prod"});
  auto substituted =
      hap::attestation::sign(request, context, hap::testing::kNow);
  EXPECT_TRUE(substituted);
}

TEST(attestation_signer, validation_error_lists_every_violation) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v03_request();
  request.frame_hash = "sha256:nothex";
  request.ttl = 90000;
  request.resolved_domains.push_back(hap::schema::resolved_domain_t{
      .domain = "legal", .did = "", .env = "dev", .disclosure_hash = "x"});
  request.resolved_domains.push_back(request.resolved_domains.front());

  auto issued = hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(issued);
  EXPECT_EQ(issued.code(), hap::schema::error_code::validation_error);
  const auto& violations = issued.error().violations;
  EXPECT_TRUE(mentions(violations, "invalid frame_hash"));
  EXPECT_TRUE(mentions(violations, "has no did"));
  EXPECT_TRUE(mentions(violations, "domain \"legal\" not defined"));
  EXPECT_TRUE(mentions(violations, "invalid env \"dev\""));
  EXPECT_TRUE(mentions(violations, "invalid disclosure_hash for domain legal"));
  EXPECT_TRUE(mentions(violations, "resolved more than once"));
  EXPECT_TRUE(mentions(violations, "exceeds profile maximum"));
}

TEST(attestation_signer, payload_version_must_match_profile) {
  auto context = hap::testing::make_signing_context();
  auto request = make_v03_request();
  request.profile_id = "deploy-gate@0.2";
  auto issued = hap::attestation::sign(request, context, hap::testing::kNow);
  ASSERT_FALSE(issued);
  EXPECT_EQ(issued.code(), hap::schema::error_code::validation_error);
  EXPECT_TRUE(
      mentions(issued.error().violations, "does not accept this payload"));
}
