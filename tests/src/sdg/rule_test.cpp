#include <gtest/gtest.h>
#include <hap/sdg/rule.hpp>

TEST(sdg_rule, parses_not_subset_rule) {
  auto predicate = hap::sdg::parse_detection_rule(
      "affected_domains \xE2\x8A\x84 declared_decision_owner_scopes");
  ASSERT_TRUE(predicate.has_value());
  ASSERT_TRUE(std::holds_alternative<hap::sdg::not_subset_t>(*predicate));
  const auto& rule = std::get<hap::sdg::not_subset_t>(*predicate);
  EXPECT_EQ(rule.left, hap::sdg::set_field_t::affected_domains);
  EXPECT_EQ(rule.right, hap::sdg::set_field_t::declared_decision_owner_scopes);
  EXPECT_TRUE(hap::sdg::is_structural(*predicate));
}

TEST(sdg_rule, parses_count_conjunction_and_semantic_rules) {
  auto count =
      hap::sdg::parse_detection_rule("count(unique(frame_hashes)) > 1");
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(std::get<hap::sdg::distinct_count_t>(*count).threshold, 1u);

  auto conjunction = hap::sdg::parse_detection_rule(
      "tradeoff_mode=canary AND execution_path!=deploy-prod-canary");
  ASSERT_TRUE(conjunction.has_value());
  const auto& terms = std::get<hap::sdg::conjunction_t>(*conjunction).terms;
  ASSERT_EQ(terms.size(), 2u);
  EXPECT_TRUE(terms[0].equal);
  EXPECT_FALSE(terms[1].equal);
  EXPECT_EQ(terms[1].value, "deploy-prod-canary");

  auto semantic = hap::sdg::parse_detection_rule(
      "semantic_distance(objective_text, diff_summary) > threshold");
  ASSERT_TRUE(semantic.has_value());
  EXPECT_FALSE(hap::sdg::is_structural(*semantic));
}

TEST(sdg_rule, unknown_rules_and_fields_do_not_parse) {
  EXPECT_FALSE(hap::sdg::parse_detection_rule("always").has_value());
  EXPECT_FALSE(hap::sdg::parse_detection_rule(
                   "owners \xE2\x8A\x84 declared_decision_owner_scopes")
                   .has_value());
  EXPECT_FALSE(
      hap::sdg::parse_detection_rule("count(unique(reviewers)) > 1")
          .has_value());
  EXPECT_FALSE(
      hap::sdg::parse_detection_rule("tradeoff_mode=canary AND").has_value());
}

TEST(sdg_rule, count_threshold_beyond_size_t_does_not_parse) {
  EXPECT_FALSE(hap::sdg::parse_detection_rule(
                   "count(unique(frame_hashes)) > 99999999999999999999999")
                   .has_value());

  auto compiled = hap::sdg::compile(hap::schema::sdg_definition_t{
      .id = "custom/huge_count@1.0",
      .detection_rules = {"count(unique(frame_hashes)) > "
                          "99999999999999999999999"},
      .stop_trigger = true});
  ASSERT_TRUE(compiled);
  ASSERT_EQ(compiled.value().predicates.size(), 1u);
  EXPECT_FALSE(compiled.value().predicates[0].has_value());
}

TEST(sdg_rule, not_subset_fires_on_any_uncovered_element) {
  auto predicate = hap::sdg::parse_detection_rule(
      "affected_domains \xE2\x8A\x84 declared_decision_owner_scopes");
  ASSERT_TRUE(predicate.has_value());
  auto context = hap::sdg::review_context_t{
      .affected_domains = {"engineering", "security"},
      .declared_decision_owner_scopes = {"engineering"}};
  EXPECT_TRUE(hap::sdg::evaluate(*predicate, context));

  context.declared_decision_owner_scopes.push_back("security");
  EXPECT_FALSE(hap::sdg::evaluate(*predicate, context));

  context.affected_domains.clear();
  EXPECT_FALSE(hap::sdg::evaluate(*predicate, context));
}

TEST(sdg_rule, distinct_count_ignores_duplicates) {
  auto predicate =
      hap::sdg::parse_detection_rule("count(unique(frame_hashes)) > 1");
  ASSERT_TRUE(predicate.has_value());
  auto context =
      hap::sdg::review_context_t{.frame_hashes = {"sha256:a", "sha256:a"}};
  EXPECT_FALSE(hap::sdg::evaluate(*predicate, context));
  context.frame_hashes.push_back("sha256:b");
  EXPECT_TRUE(hap::sdg::evaluate(*predicate, context));
}

TEST(sdg_rule, conjunction_requires_every_term) {
  auto predicate = hap::sdg::parse_detection_rule(
      "tradeoff_mode=full AND execution_path!=deploy-prod-full");
  ASSERT_TRUE(predicate.has_value());
  auto context = hap::sdg::review_context_t{
      .tradeoff_mode = "full", .execution_path = "deploy-prod-canary"};
  EXPECT_TRUE(hap::sdg::evaluate(*predicate, context));
  context.execution_path = "deploy-prod-full";
  EXPECT_FALSE(hap::sdg::evaluate(*predicate, context));
  context.tradeoff_mode = "canary";
  context.execution_path = "deploy-prod-canary";
  EXPECT_FALSE(hap::sdg::evaluate(*predicate, context));
}

TEST(sdg_rule, boolean_fields_compare_as_text) {
  auto predicate =
      hap::sdg::parse_detection_rule("decision_file_present=false");
  ASSERT_TRUE(predicate.has_value());
  auto context = hap::sdg::review_context_t{};
  EXPECT_FALSE(hap::sdg::evaluate(*predicate, context));
  context.decision_file_present = false;
  EXPECT_TRUE(hap::sdg::evaluate(*predicate, context));
}

TEST(sdg_rule, semantic_mismatch_uses_term_overlap) {
  EXPECT_FALSE(hap::sdg::semantic_mismatch(
      "Add pagination to the orders endpoint",
      "Implements pagination for orders endpoint responses"));
  EXPECT_TRUE(hap::sdg::semantic_mismatch(
      "Improve checkout latency for mobile users",
      "Rename logging configuration keys"));
  EXPECT_FALSE(hap::sdg::semantic_mismatch("", "anything"));
  EXPECT_FALSE(hap::sdg::semantic_mismatch("fix it", "unrelated change"));
}

TEST(sdg_rule, compile_rejects_semantic_stop_triggers) {
  auto definition = hap::schema::sdg_definition_t{
      .id = "custom/semantic_stop@1.0",
      .detection_rules = {"semantic_distance(objective_text, diff_summary) > "
                          "threshold"},
      .stop_trigger = true};
  auto compiled = hap::sdg::compile(definition);
  ASSERT_FALSE(compiled);
  EXPECT_EQ(compiled.code(), hap::schema::error_code::validation_error);

  definition.stop_trigger = false;
  EXPECT_TRUE(hap::sdg::compile(definition));
}

TEST(sdg_rule, compile_keeps_unknown_rules_inert) {
  auto compiled = hap::sdg::compile(hap::schema::sdg_definition_t{
      .id = "custom/mixed@1.0",
      .detection_rules = {"gibberish", "decision_file_present=false"},
      .stop_trigger = true});
  ASSERT_TRUE(compiled);
  ASSERT_EQ(compiled.value().predicates.size(), 2u);
  EXPECT_FALSE(compiled.value().predicates[0].has_value());
  EXPECT_TRUE(compiled.value().predicates[1].has_value());

  auto empty = hap::sdg::compile(hap::schema::sdg_definition_t{});
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().violations.size(), 2u);
}
