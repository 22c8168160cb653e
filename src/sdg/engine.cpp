#include <hap/sdg/catalogue.hpp>
#include <hap/sdg/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.sdg";

}  // namespace

namespace hap::sdg {

sdg_result_t run(const compiled_sdg_t& sdg, const review_context_t& context) {
  const auto triggered = std::ranges::any_of(
      sdg.predicates, [&](const std::optional<predicate_t>& predicate) {
        return predicate && evaluate(*predicate, context);
      });
  auto out = sdg_result_t{.id = sdg.definition.id,
                          .signal_intent = sdg.definition.signal_intent,
                          .triggered = triggered,
                          .stop_trigger = sdg.definition.stop_trigger};
  if (triggered) {
    out.user_prompt = sdg.definition.user_prompt;
  }
  return out;
}

result<evaluation_t> evaluate(const std::vector<sdg_definition_t>& definitions,
                              const review_context_t& context) {
  auto compiled = std::vector<compiled_sdg_t>{};
  compiled.reserve(definitions.size());
  auto violations = std::vector<std::string>{};
  for (const auto& definition : definitions) {
    auto sdg = compile(definition);
    if (!sdg) {
      const auto& found = sdg.error().violations;
      violations.insert(std::end(violations), std::begin(found),
                        std::end(found));
      continue;
    }
    compiled.push_back(std::move(sdg).value());
  }
  if (!violations.empty()) {
    auto log = "Invalid SDG rule set: " + violations.front();
    return make_error(error_code::validation_error, std::move(log),
                      std::move(violations), kCodespace);
  }

  auto evaluation = evaluation_t{};
  for (const auto& sdg : compiled) {
    auto outcome = run(sdg, context);
    if (outcome.triggered) {
      if (outcome.stop_trigger) {
        spdlog::info("SDG {} triggered a hard stop", outcome.id);
        evaluation.hard_stops.push_back(outcome);
      } else {
        spdlog::info("SDG {} raised a warning", outcome.id);
        evaluation.warnings.push_back(outcome);
      }
    }
    evaluation.results.push_back(std::move(outcome));
  }
  return evaluation;
}

result<evaluation_t> evaluate_profile_set(const profile_t& profile,
                                          const review_context_t& context) {
  auto definitions = std::vector<sdg_definition_t>{};
  auto missing = std::vector<std::string>{};
  for (const auto& id : profile.sdg_set) {
    const auto* definition = find_definition(id);
    if (definition == nullptr) {
      missing.push_back("unknown sdg " + id);
      continue;
    }
    definitions.push_back(*definition);
  }
  if (!missing.empty()) {
    return make_error(error_code::validation_error,
                      "Profile " + profile.id + " names unknown SDGs",
                      std::move(missing), kCodespace);
  }
  return evaluate(definitions, context);
}

}  // namespace hap::sdg
