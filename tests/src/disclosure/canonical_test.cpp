#include <gtest/gtest.h>
#include <hap/disclosure/canonical.hpp>
#include <hap/profile/registry.hpp>
#include <hap/testing/common.hpp>

#include <algorithm>

namespace {

bool mentions(const std::vector<std::string>& violations,
              const std::string_view needle) {
  return std::ranges::any_of(violations, [&](const std::string& violation) {
    return violation.find(needle) != std::string::npos;
  });
}

}  // namespace

TEST(disclosure_paths, normalizes_separators_and_prefixes) {
  EXPECT_EQ(hap::disclosure::canonicalize_path("./src//api/"), "src/api");
  EXPECT_EQ(hap::disclosure::canonicalize_path("././a.txt"), "a.txt");
  EXPECT_EQ(hap::disclosure::canonicalize_path("a/b/c"), "a/b/c");
  EXPECT_EQ(hap::disclosure::canonicalize_path("a..b/c"), "a..b/c");
}

TEST(disclosure_paths, rejects_parent_segments_and_empty_paths) {
  EXPECT_FALSE(hap::disclosure::canonicalize_path("../etc/passwd"));
  EXPECT_FALSE(hap::disclosure::canonicalize_path("src/../../x"));
  EXPECT_FALSE(hap::disclosure::canonicalize_path(""));
  EXPECT_FALSE(hap::disclosure::canonicalize_path("./"));
  EXPECT_FALSE(hap::disclosure::canonicalize_path("/"));
}

TEST(disclosure_paths, canonicalize_paths_sorts_and_reports_every_bad_path) {
  auto sorted = hap::disclosure::canonicalize_paths({"b.cpp", "./a.cpp"});
  ASSERT_TRUE(sorted);
  EXPECT_EQ(sorted.value(), (std::vector<std::string>{"a.cpp", "b.cpp"}));

  auto rejected =
      hap::disclosure::canonicalize_paths({"../x", "ok.cpp", "", "y/../z"});
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.code(), hap::schema::error_code::validation_error);
  EXPECT_EQ(rejected.error().violations.size(), 3u);
}

TEST(disclosure_paths, invalid_utf8_paths_are_rejected) {
  auto rejected = hap::disclosure::canonicalize_paths({"src/\xff.cpp"});
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.code(), hap::schema::error_code::validation_error);
  EXPECT_TRUE(mentions(rejected.error().violations,
                       "changed_paths[0] is not valid UTF-8"));
}

TEST(disclosure_text, length_counts_code_points) {
  EXPECT_EQ(hap::disclosure::text_length("abc"), 3u);
  // "naïve" and a CJK character.
  EXPECT_EQ(hap::disclosure::text_length("na\xC3\xAFve"), 5u);
  EXPECT_EQ(hap::disclosure::text_length("\xE6\x97\xA5"), 1u);
}

TEST(disclosure_v02, canonical_form_is_sorted_compact_json) {
  const auto& profile = hap::profile::deploy_gate_v02();
  auto canonical = hap::disclosure::canonical_disclosure(
      hap::testing::make_disclosure_v02(), profile);
  ASSERT_TRUE(canonical);
  EXPECT_EQ(canonical.value(),
            R"({"changed_paths":["src/api/handler.cpp","src/db/schema.sql"],)"
            R"("repo":"acme/widgets","risk_flags":["migration","public_api"],)"
            R"("sha":"0123456789abcdef0123456789abcdef01234567"})");

  auto hash = hap::disclosure::disclosure_hash(
      hap::testing::make_disclosure_v02(), profile);
  ASSERT_TRUE(hash);
  EXPECT_EQ(hash.value(), hap::testing::kDisclosureV02Hash);
}

TEST(disclosure_v02, list_order_does_not_change_hash) {
  const auto& profile = hap::profile::deploy_gate_v02();
  auto reordered = hap::testing::make_disclosure_v02();
  std::ranges::reverse(reordered.changed_paths);
  std::ranges::reverse(reordered.risk_flags);
  auto hash = hap::disclosure::disclosure_hash(reordered, profile);
  ASSERT_TRUE(hash);
  EXPECT_EQ(hash.value(), hap::testing::kDisclosureV02Hash);
}

TEST(disclosure_v02, domain_rationale_is_hashed_and_length_checked) {
  const auto& profile = hap::profile::deploy_gate_v02();
  auto disclosure = hap::testing::make_disclosure_v02();
  disclosure.domains["engineering"] = hap::schema::domain_rationale_t{
      .problem = "List endpoint returns everything at once",
      .objective = "Bounded responses for large tenants",
      .tradeoffs = "Clients must follow the next-page cursor"};
  auto hash = hap::disclosure::disclosure_hash(disclosure, profile);
  ASSERT_TRUE(hash);
  EXPECT_NE(hash.value(), hap::testing::kDisclosureV02Hash);

  disclosure.domains["engineering"].problem = "too short";
  disclosure.domains["legal"] = disclosure.domains["engineering"];
  auto violations = hap::disclosure::validate_disclosure(disclosure, profile);
  EXPECT_TRUE(mentions(violations, "engineering.problem must be at least 20"));
  EXPECT_TRUE(mentions(violations, "Unknown domain \"legal\""));
}

TEST(disclosure_v02, rejects_escaping_paths) {
  auto disclosure = hap::testing::make_disclosure_v02();
  disclosure.changed_paths.push_back("../secrets");
  auto hash = hap::disclosure::disclosure_hash(
      disclosure, hap::profile::deploy_gate_v02());
  ASSERT_FALSE(hash);
  EXPECT_EQ(hash.code(), hap::schema::error_code::validation_error);
}

TEST(disclosure_v02, distinct_invalid_utf8_inputs_never_share_a_hash) {
  const auto& profile = hap::profile::deploy_gate_v02();
  auto first = hap::testing::make_disclosure_v02();
  first.changed_paths = {"src/\xff.cpp"};
  auto second = hap::testing::make_disclosure_v02();
  second.changed_paths = {"src/\xfe.cpp"};

  auto first_hash = hap::disclosure::disclosure_hash(first, profile);
  auto second_hash = hap::disclosure::disclosure_hash(second, profile);
  ASSERT_FALSE(first_hash);
  ASSERT_FALSE(second_hash);
  EXPECT_EQ(first_hash.code(), hap::schema::error_code::validation_error);
  EXPECT_EQ(second_hash.code(), hap::schema::error_code::validation_error);

  auto flagged = hap::testing::make_disclosure_v02();
  flagged.risk_flags.push_back("caf\xc3");
  EXPECT_TRUE(mentions(hap::disclosure::validate_disclosure(flagged, profile),
                       "risk_flags[2] is not valid UTF-8"));
}

TEST(disclosure_v03, engineering_disclosure_hash_is_stable) {
  const auto& profile = hap::profile::deploy_gate_v03();
  auto canonical = hap::disclosure::canonical_domain_disclosure(
      "engineering", hap::testing::make_engineering_disclosure(), profile);
  ASSERT_TRUE(canonical);
  EXPECT_EQ(canonical.value(),
            R"({"changed_paths":["src/api/handler.cpp","src/db/schema.sql"],)"
            R"("diff_summary":"Adds pagination to the list endpoint",)"
            R"("rollback_strategy":"Revert the commit and redeploy",)"
            R"("test_status":"All unit and integration tests pass"})");

  auto hash = hap::disclosure::domain_disclosure_hash(
      "engineering", hap::testing::make_engineering_disclosure(), profile);
  ASSERT_TRUE(hash);
  EXPECT_EQ(hash.value(),
            "sha256:"
            "b635c314bf808d8b4ee85add5e35e236e487d32a6435a54c7f12164a3037f3c8");
}

TEST(disclosure_v03, validation_reports_every_problem) {
  const auto& profile = hap::profile::deploy_gate_v03();
  auto fields = hap::schema::domain_disclosure_t{
      {"diff_summary", std::vector<std::string>{"not", "text"}},
      {"changed_paths", std::string{"a.cpp"}},
      {"test_status", std::string{"ok"}},
      {"owner", std::string{"alice"}}};
  auto violations =
      hap::disclosure::validate_domain_disclosure("engineering", fields, profile);
  EXPECT_TRUE(mentions(violations,
                       "Missing required field: engineering.rollback_strategy"));
  EXPECT_TRUE(mentions(violations, "engineering.diff_summary must be a string"));
  EXPECT_TRUE(
      mentions(violations, "engineering.changed_paths must be a list"));
  EXPECT_TRUE(
      mentions(violations, "engineering.test_status must be at least 10"));
  EXPECT_TRUE(mentions(violations, "Unknown field \"owner\""));

  auto unknown = hap::disclosure::validate_domain_disclosure(
      "legal", fields, profile);
  ASSERT_EQ(unknown.size(), 1u);
  EXPECT_TRUE(mentions(unknown, "Unknown domain \"legal\""));
}

TEST(disclosure_v03, invalid_utf8_fields_are_rejected) {
  const auto& profile = hap::profile::deploy_gate_v03();
  auto paths = hap::testing::make_engineering_disclosure();
  paths["changed_paths"] = std::vector<std::string>{"src/\xff.cpp"};
  auto hash =
      hap::disclosure::domain_disclosure_hash("engineering", paths, profile);
  ASSERT_FALSE(hash);
  EXPECT_EQ(hash.code(), hap::schema::error_code::validation_error);

  auto summary = hap::testing::make_engineering_disclosure();
  summary["diff_summary"] =
      std::string{"Adds pagination \xed\xa0\x80 to the list endpoint"};
  auto canonical = hap::disclosure::canonical_domain_disclosure(
      "engineering", summary, profile);
  ASSERT_FALSE(canonical);
  EXPECT_EQ(canonical.code(), hap::schema::error_code::validation_error);
  EXPECT_TRUE(mentions(canonical.error().violations,
                       "engineering.diff_summary is not valid UTF-8"));
}

TEST(disclosure_v03, per_domain_hashes_are_independent) {
  const auto& profile = hap::profile::deploy_gate_v03();
  auto file = hap::schema::decision_file_t{
      .profile = "deploy-gate@0.3",
      .execution_path = "deploy-prod-full",
      .disclosure = {{"engineering", hap::testing::make_engineering_disclosure()},
                     {"release_management",
                      hap::testing::make_release_disclosure()}}};
  auto hashes = hap::disclosure::domain_disclosure_hashes(file, profile);
  ASSERT_TRUE(hashes);
  ASSERT_EQ(hashes.value().size(), 2u);
  const auto engineering = hashes.value().at("engineering");

  file.disclosure["release_management"]["rollback_plan"] =
      std::string{"Page the release captain and roll back"};
  auto changed = hap::disclosure::domain_disclosure_hashes(file, profile);
  ASSERT_TRUE(changed);
  EXPECT_EQ(changed.value().at("engineering"), engineering);
  EXPECT_NE(changed.value().at("release_management"),
            hashes.value().at("release_management"));
}

TEST(disclosure_v03, decision_file_checks) {
  const auto& profile = hap::profile::deploy_gate_v03();
  auto empty = hap::schema::decision_file_t{.profile = "deploy-gate@0.3"};
  auto no_domains = hap::disclosure::domain_disclosure_hashes(empty, profile);
  ASSERT_FALSE(no_domains);
  EXPECT_TRUE(mentions(no_domains.error().violations, "no domains"));

  auto wrong = hap::schema::decision_file_t{
      .profile = "deploy-gate@0.2",
      .disclosure = {{"security", hap::testing::make_security_disclosure()}}};
  auto mismatch = hap::disclosure::domain_disclosure_hashes(wrong, profile);
  ASSERT_FALSE(mismatch);
  EXPECT_TRUE(mentions(mismatch.error().violations, "does not match"));
}

TEST(disclosure_v03, parse_decision_file_reports_validation_error) {
  auto parsed = hap::disclosure::parse_decision_file(R"({
    "profile": "deploy-gate@0.3",
    "disclosure": {"security": {
      "affected_surfaces": ["auth"],
      "threat_category": "authentication",
      "mitigation_path": "Token scopes are checked server side"
    }}
  })");
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed.value().disclosure.count("security"), 1u);

  auto broken = hap::disclosure::parse_decision_file("{\"disclosure\": 3}");
  ASSERT_FALSE(broken);
  EXPECT_EQ(broken.code(), hap::schema::error_code::validation_error);
}
