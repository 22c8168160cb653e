#pragma once

#include <hap/schema/profile.hpp>
#include <hap/schema/result.hpp>
#include <hap/schema/sdg_definition.hpp>
#include <hap/sdg/rule.hpp>

#include <optional>
#include <string>
#include <vector>

namespace hap::sdg {

struct sdg_result_t final {
  std::string id;
  std::string signal_intent;
  bool triggered{false};
  bool stop_trigger{false};
  // Only set when triggered.
  std::optional<std::string> user_prompt;
};

struct evaluation_t final {
  // One entry per rule, in rule-set order.
  std::vector<sdg_result_t> results;
  std::vector<sdg_result_t> hard_stops;
  std::vector<sdg_result_t> warnings;

  bool has_hard_stop() const { return !hard_stops.empty(); }
};

sdg_result_t run(const compiled_sdg_t& sdg, const review_context_t& context);

/// Evaluate an ordered rule set. A rule fires when any of its predicates
/// holds; fired stop-trigger rules are hard stops, all other fired rules are
/// warnings. Fails with `validation_error` when a definition is invalid.
hap::schema::result<evaluation_t> evaluate(
    const std::vector<hap::schema::sdg_definition_t>& definitions,
    const review_context_t& context);

/// Evaluate the profile's SDG set from the builtin catalogue. An id missing
/// from the catalogue fails with `validation_error`.
hap::schema::result<evaluation_t> evaluate_profile_set(
    const hap::schema::profile_t& profile,
    const review_context_t& context);

}  // namespace hap::sdg
