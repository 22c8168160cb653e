#include <hap/schema/encoding/json/encoder.hpp>
#include <hap/sdg/catalogue.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.sdg";

std::vector<sdg_definition_t> make_builtin_definitions() {
  return {
      sdg_definition_t{
          .id = "deploy/missing_decision_owner@1.0",
          .signal_intent = "missing_decision_owner",
          .description = "Detects when changes affect domains without a "
                         "declared decision owner",
          .observable_structures = {"affected_domains",
                                    "declared_decision_owner_scopes"},
          .detection_rules = {"affected_domains \xE2\x8A\x84 "
                              "declared_decision_owner_scopes"},
          .stop_trigger = true,
          .user_prompt = "Changes affect domains without a declared decision "
                         "owner. Add the required scope before proceeding."},
      sdg_definition_t{
          .id = "deploy/commitment_mismatch@1.0",
          .signal_intent = "commitment_mismatch",
          .description =
              "Detects when reviewers are not committing to the same frame",
          .observable_structures = {"frame_hashes"},
          .detection_rules = {"count(unique(frame_hashes)) > 1"},
          .stop_trigger = true,
          .user_prompt = "Reviewers have different frame hashes. All "
                         "reviewers must commit to the same action."},
      sdg_definition_t{
          .id = "deploy/tradeoff_execution_mismatch@1.0",
          .signal_intent = "tradeoff_execution_mismatch",
          .description = "Detects when the selected tradeoff mode does not "
                         "match the execution path in the frame",
          .observable_structures = {"tradeoff_mode", "execution_path"},
          .detection_rules =
              {"tradeoff_mode=canary AND execution_path!=deploy-prod-canary",
               "tradeoff_mode=full AND execution_path!=deploy-prod-full"},
          .stop_trigger = true,
          .user_prompt = "Your selected tradeoff mode does not match the "
                         "execution path. This indicates a Frame mismatch."},
      sdg_definition_t{
          .id = "deploy/objective_diff_mismatch@1.0",
          .signal_intent = "objective_diff_mismatch",
          .description = "Warns when the stated objective appears misaligned "
                         "with the changes",
          .observable_structures = {"objective_text", "diff_summary"},
          .detection_rules = {"semantic_distance(objective_text, "
                              "diff_summary) > threshold"},
          .stop_trigger = false,
          .user_prompt = "Your stated objective appears misaligned with the "
                         "changes in this commit. Review carefully before "
                         "proceeding."},
      sdg_definition_t{
          .id = "deploy/decision_file_missing@1.0",
          .signal_intent = "decision_file_missing",
          .description =
              "Detects when the commit ships no decision file to disclose",
          .observable_structures = {"decision_file_present"},
          .detection_rules = {"decision_file_present=false"},
          .stop_trigger = true,
          .user_prompt = "No decision file was found for this commit. Add "
                         "one before requesting attestations."},
      sdg_definition_t{
          .id = "deploy/disclosure_incomplete@1.0",
          .signal_intent = "disclosure_incomplete",
          .description = "Detects when a domain required by the execution "
                         "path has no disclosure",
          .observable_structures = {"required_domains", "disclosed_domains"},
          .detection_rules = {"required_domains \xE2\x8A\x84 "
                              "disclosed_domains"},
          .stop_trigger = true,
          .user_prompt = "The decision file does not disclose every domain "
                         "this execution path requires."},
  };
}

}  // namespace

namespace hap::sdg {

const std::vector<sdg_definition_t>& builtin_definitions() {
  static const auto definitions = make_builtin_definitions();
  return definitions;
}

const sdg_definition_t* find_definition(const std::string_view id) {
  const auto& definitions = builtin_definitions();
  auto it = std::ranges::find_if(
      definitions, [&](const sdg_definition_t& d) { return d.id == id; });
  if (it == std::end(definitions)) {
    return nullptr;
  }
  return &*it;
}

result<std::vector<sdg_definition_t>> load_definitions(
    const std::string_view json) {
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  auto error = std::string{};
  if (auto many = encoder.try_decode<std::vector<sdg_definition_t>>(json, error)) {
    return std::move(*many);
  }
  if (auto one = encoder.try_decode<sdg_definition_t>(json, error)) {
    return std::vector<sdg_definition_t>{std::move(*one)};
  }
  spdlog::warn("Unreadable SDG definitions: {}", error);
  return make_error(error_code::validation_error,
                    "Invalid SDG definitions: " + error, {error}, kCodespace);
}

}  // namespace hap::sdg
