#pragma once

#include <hap/schema/enum_string.hpp>
#include <hap/schema/result.hpp>
#include <hap/schema/sdg_definition.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hap::sdg {

/// Everything a rule may look at. Assembled by the caller; rules never
/// fetch anything themselves.
struct review_context_t final {
  // Structural inputs.
  std::vector<std::string> affected_domains;
  std::vector<std::string> declared_decision_owner_scopes;
  std::vector<std::string> frame_hashes;
  std::string tradeoff_mode;
  std::string execution_path;
  bool decision_file_present{true};
  std::vector<std::string> required_domains;
  std::vector<std::string> disclosed_domains;

  // Free text, only ever read by semantic predicates.
  std::string objective_text;
  std::string diff_summary;
};

enum class set_field_t : uint8_t {
  affected_domains = 0,
  declared_decision_owner_scopes = 1,
  frame_hashes = 2,
  required_domains = 3,
  disclosed_domains = 4
};

enum class scalar_field_t : uint8_t {
  tradeoff_mode = 0,
  execution_path = 1,
  decision_file_present = 2
};

enum class text_field_t : uint8_t { objective_text = 0, diff_summary = 1 };

inline constexpr auto kSetFieldMappings = std::array{
    std::pair<std::string_view, set_field_t>{"affected_domains",
                                             set_field_t::affected_domains},
    std::pair<std::string_view, set_field_t>{
        "declared_decision_owner_scopes",
        set_field_t::declared_decision_owner_scopes},
    std::pair<std::string_view, set_field_t>{"frame_hashes",
                                             set_field_t::frame_hashes},
    std::pair<std::string_view, set_field_t>{"required_domains",
                                             set_field_t::required_domains},
    std::pair<std::string_view, set_field_t>{"disclosed_domains",
                                             set_field_t::disclosed_domains},
};

inline constexpr auto kScalarFieldMappings = std::array{
    std::pair<std::string_view, scalar_field_t>{"tradeoff_mode",
                                                scalar_field_t::tradeoff_mode},
    std::pair<std::string_view, scalar_field_t>{
        "execution_path", scalar_field_t::execution_path},
    std::pair<std::string_view, scalar_field_t>{
        "decision_file_present", scalar_field_t::decision_file_present},
};

inline constexpr auto kTextFieldMappings = std::array{
    std::pair<std::string_view, text_field_t>{"objective_text",
                                              text_field_t::objective_text},
    std::pair<std::string_view, text_field_t>{"diff_summary",
                                              text_field_t::diff_summary},
};

// `left ⊄ right`: some element of `left` is absent from `right`.
struct not_subset_t final {
  set_field_t left;
  set_field_t right;
};

// `count(unique(field)) > threshold`
struct distinct_count_t final {
  set_field_t field;
  std::size_t threshold{};
};

struct comparison_t final {
  scalar_field_t field;
  bool equal{true};
  std::string value;
};

// `a=x AND b!=y ...`
struct conjunction_t final {
  std::vector<comparison_t> terms;
};

// `semantic_distance(left, right) > threshold`. Reads free text, so it can
// only ever warn.
struct semantic_distance_t final {
  text_field_t left;
  text_field_t right;
};

using predicate_t = std::variant<not_subset_t,
                                 distinct_count_t,
                                 conjunction_t,
                                 semantic_distance_t>;

/// Minimum share of objective terms that must appear in the diff summary.
inline constexpr auto kSemanticOverlapThreshold = 0.2;

std::optional<predicate_t> parse_detection_rule(std::string_view rule);

bool is_structural(const predicate_t& predicate);

bool evaluate(const predicate_t& predicate, const review_context_t& context);

/// Term-overlap heuristic behind `semantic_distance`. True when fewer than
/// 20% of the objective's terms (longer than three characters) occur in
/// the diff summary. Never fires when either text is empty.
bool semantic_mismatch(std::string_view objective, std::string_view diff);

/// A definition paired with its parsed rules. Unparseable rules are kept as
/// std::nullopt and never fire.
struct compiled_sdg_t final {
  hap::schema::sdg_definition_t definition;
  std::vector<std::optional<predicate_t>> predicates;
};

/// Fails with `validation_error` when the definition has no id or rules, or
/// when a stop-trigger rule depends on a semantic predicate.
hap::schema::result<compiled_sdg_t> compile(
    const hap::schema::sdg_definition_t& definition);

}  // namespace hap::sdg
