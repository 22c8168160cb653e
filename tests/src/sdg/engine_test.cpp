#include <gtest/gtest.h>
#include <hap/profile/registry.hpp>
#include <hap/sdg/catalogue.hpp>
#include <hap/sdg/engine.hpp>

#include <algorithm>

namespace {

hap::sdg::review_context_t clean_context() {
  return hap::sdg::review_context_t{
      .affected_domains = {"engineering"},
      .declared_decision_owner_scopes = {"engineering"},
      .frame_hashes = {"sha256:aa", "sha256:aa"},
      .tradeoff_mode = "canary",
      .execution_path = "deploy-prod-canary",
      .decision_file_present = true,
      .required_domains = {"engineering"},
      .disclosed_domains = {"engineering"},
      .objective_text = "Add pagination to the orders endpoint",
      .diff_summary = "Implements pagination for orders endpoint responses"};
}

bool fired(const std::vector<hap::sdg::sdg_result_t>& results,
           const std::string_view id) {
  return std::ranges::any_of(results, [&](const hap::sdg::sdg_result_t& r) {
    return r.id == id;
  });
}

}  // namespace

TEST(sdg_engine, builtin_catalogue_covers_both_profiles) {
  for (const auto* profile :
       {&hap::profile::deploy_gate_v02(), &hap::profile::deploy_gate_v03()}) {
    for (const auto& id : profile->sdg_set) {
      EXPECT_NE(hap::sdg::find_definition(id), nullptr) << id;
    }
  }
  for (const auto& definition : hap::sdg::builtin_definitions()) {
    EXPECT_TRUE(hap::sdg::compile(definition)) << definition.id;
  }
}

TEST(sdg_engine, clean_context_triggers_nothing) {
  auto evaluation = hap::sdg::evaluate_profile_set(
      hap::profile::deploy_gate_v02(), clean_context());
  ASSERT_TRUE(evaluation);
  EXPECT_EQ(evaluation.value().results.size(), 4u);
  EXPECT_FALSE(evaluation.value().has_hard_stop());
  EXPECT_TRUE(evaluation.value().warnings.empty());
}

TEST(sdg_engine, partitions_hard_stops_and_warnings) {
  auto context = clean_context();
  context.frame_hashes.push_back("sha256:bb");
  context.objective_text = "Improve checkout latency for mobile users";
  auto evaluation = hap::sdg::evaluate_profile_set(
      hap::profile::deploy_gate_v02(), context);
  ASSERT_TRUE(evaluation);
  const auto& value = evaluation.value();
  EXPECT_TRUE(value.has_hard_stop());
  ASSERT_EQ(value.hard_stops.size(), 1u);
  EXPECT_EQ(value.hard_stops[0].id, "deploy/commitment_mismatch@1.0");
  ASSERT_TRUE(value.hard_stops[0].user_prompt.has_value());
  ASSERT_EQ(value.warnings.size(), 1u);
  EXPECT_EQ(value.warnings[0].id, "deploy/objective_diff_mismatch@1.0");
  EXPECT_FALSE(value.warnings[0].stop_trigger);
}

TEST(sdg_engine, results_follow_rule_set_order) {
  auto evaluation = hap::sdg::evaluate_profile_set(
      hap::profile::deploy_gate_v03(), clean_context());
  ASSERT_TRUE(evaluation);
  const auto& results = evaluation.value().results;
  const auto& ids = hap::profile::deploy_gate_v03().sdg_set;
  ASSERT_EQ(results.size(), ids.size());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(results[i].id, ids[i]);
    EXPECT_FALSE(results[i].user_prompt.has_value());
  }
}

TEST(sdg_engine, v03_rules_catch_missing_decision_file_and_disclosure) {
  auto context = clean_context();
  context.decision_file_present = false;
  context.required_domains = {"engineering", "release_management"};
  auto evaluation = hap::sdg::evaluate_profile_set(
      hap::profile::deploy_gate_v03(), context);
  ASSERT_TRUE(evaluation);
  const auto& stops = evaluation.value().hard_stops;
  EXPECT_EQ(stops.size(), 2u);
  EXPECT_TRUE(fired(stops, "deploy/decision_file_missing@1.0"));
  EXPECT_TRUE(fired(stops, "deploy/disclosure_incomplete@1.0"));
}

TEST(sdg_engine, tradeoff_rule_fires_on_either_branch) {
  auto context = clean_context();
  context.tradeoff_mode = "full";
  auto evaluation = hap::sdg::evaluate_profile_set(
      hap::profile::deploy_gate_v02(), context);
  ASSERT_TRUE(evaluation);
  EXPECT_TRUE(fired(evaluation.value().hard_stops,
                    "deploy/tradeoff_execution_mismatch@1.0"));
}

TEST(sdg_engine, invalid_custom_definition_fails_whole_set) {
  auto definitions = std::vector<hap::schema::sdg_definition_t>{
      *hap::sdg::find_definition("deploy/commitment_mismatch@1.0"),
      hap::schema::sdg_definition_t{
          .id = "custom/bad@1.0",
          .detection_rules = {"semantic_distance(objective_text, "
                              "diff_summary) > threshold"},
          .stop_trigger = true}};
  auto evaluation = hap::sdg::evaluate(definitions, clean_context());
  ASSERT_FALSE(evaluation);
  EXPECT_EQ(evaluation.code(), hap::schema::error_code::validation_error);
  ASSERT_FALSE(evaluation.error().violations.empty());
  EXPECT_NE(evaluation.error().log.find(evaluation.error().violations.front()),
            std::string::npos);
}

TEST(sdg_engine, load_definitions_accepts_object_or_array) {
  auto one = hap::sdg::load_definitions(
      R"({"id":"custom/no_file@1.0","detection_rules":)"
      R"(["decision_file_present=false"],"stop_trigger":true,)"
      R"("user_prompt":"Add a decision file."})");
  ASSERT_TRUE(one);
  ASSERT_EQ(one.value().size(), 1u);

  auto context = clean_context();
  context.decision_file_present = false;
  auto evaluation = hap::sdg::evaluate(one.value(), context);
  ASSERT_TRUE(evaluation);
  ASSERT_EQ(evaluation.value().hard_stops.size(), 1u);
  EXPECT_EQ(evaluation.value().hard_stops[0].user_prompt,
            "Add a decision file.");

  auto many = hap::sdg::load_definitions(
      R"([{"id":"a@1.0","detection_rules":["count(unique(frame_hashes)) > 1"],)"
      R"("stop_trigger":true},{"id":"b@1.0","detection_rules":)"
      R"(["decision_file_present=false"],"stop_trigger":false}])");
  ASSERT_TRUE(many);
  EXPECT_EQ(many.value().size(), 2u);

  auto broken = hap::sdg::load_definitions(R"({"id":"x"})");
  ASSERT_FALSE(broken);
  EXPECT_EQ(broken.code(), hap::schema::error_code::validation_error);
}
