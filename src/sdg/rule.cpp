#include <hap/schema/primitives.hpp>
#include <hap/sdg/rule.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <set>
#include <system_error>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.sdg";
// U+2284 NOT A SUBSET OF, UTF-8 encoded.
constexpr auto kNotSubset = std::string_view{"\xE2\x8A\x84"};
constexpr auto kAnd = std::string_view{" AND "};
constexpr auto kWhitespace = std::string_view{" \t\r\n"};

std::string_view trim(std::string_view value) {
  const auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(kWhitespace);
  return value.substr(first, last - first + 1);
}

std::optional<hap::sdg::set_field_t> set_field(const std::string_view name) {
  return from_string(trim(name), hap::sdg::kSetFieldMappings);
}

std::optional<hap::sdg::predicate_t> parse_conjunction(
    const std::string_view rule) {
  static const auto term_pattern =
      std::regex{R"(^(\w+)\s*(!=|=)\s*(\S+)$)", std::regex::ECMAScript};

  auto conjunction = hap::sdg::conjunction_t{};
  auto start = std::size_t{0};
  while (start <= rule.size()) {
    auto end = rule.find(kAnd, start);
    if (end == std::string_view::npos) {
      end = rule.size();
    }
    const auto term = std::string{trim(rule.substr(start, end - start))};
    start = end + kAnd.size();

    auto match = std::smatch{};
    if (!std::regex_match(term, match, term_pattern)) {
      return std::nullopt;
    }
    auto field = from_string(match.str(1), hap::sdg::kScalarFieldMappings);
    if (!field) {
      return std::nullopt;
    }
    conjunction.terms.push_back(hap::sdg::comparison_t{
        .field = *field, .equal = match.str(2) == "=", .value = match.str(3)});
  }
  return conjunction;
}

const std::vector<std::string>& values(const hap::sdg::review_context_t& context,
                                       const hap::sdg::set_field_t field) {
  switch (field) {
    case hap::sdg::set_field_t::affected_domains:
      return context.affected_domains;
    case hap::sdg::set_field_t::declared_decision_owner_scopes:
      return context.declared_decision_owner_scopes;
    case hap::sdg::set_field_t::frame_hashes:
      return context.frame_hashes;
    case hap::sdg::set_field_t::required_domains:
      return context.required_domains;
    case hap::sdg::set_field_t::disclosed_domains:
      return context.disclosed_domains;
  }
  hap::common::critical("unhandled sdg set field");
}

std::string value(const hap::sdg::review_context_t& context,
                  const hap::sdg::scalar_field_t field) {
  switch (field) {
    case hap::sdg::scalar_field_t::tradeoff_mode:
      return context.tradeoff_mode;
    case hap::sdg::scalar_field_t::execution_path:
      return context.execution_path;
    case hap::sdg::scalar_field_t::decision_file_present:
      return context.decision_file_present ? "true" : "false";
  }
  hap::common::critical("unhandled sdg scalar field");
}

const std::string& text(const hap::sdg::review_context_t& context,
                        const hap::sdg::text_field_t field) {
  switch (field) {
    case hap::sdg::text_field_t::objective_text:
      return context.objective_text;
    case hap::sdg::text_field_t::diff_summary:
      return context.diff_summary;
  }
  hap::common::critical("unhandled sdg text field");
}

std::string lowercase(const std::string_view value) {
  auto out = std::string{value};
  std::ranges::transform(out, std::begin(out), [](const unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool is_word(const char c) {
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || c == '_';
}

}  // namespace

namespace hap::sdg {

std::optional<predicate_t> parse_detection_rule(const std::string_view rule) {
  static const auto count_pattern = std::regex{
      R"(^count\(unique\((\w+)\)\)\s*>\s*(\d+)$)", std::regex::ECMAScript};
  static const auto semantic_pattern =
      std::regex{R"(^semantic_distance\((\w+),\s*(\w+)\)\s*>\s*threshold$)",
                 std::regex::ECMAScript};

  const auto trimmed = trim(rule);
  if (auto pos = trimmed.find(kNotSubset); pos != std::string_view::npos) {
    auto left = set_field(trimmed.substr(0, pos));
    auto right = set_field(trimmed.substr(pos + kNotSubset.size()));
    if (!left || !right) {
      return std::nullopt;
    }
    return not_subset_t{.left = *left, .right = *right};
  }

  const auto text_rule = std::string{trimmed};
  auto match = std::smatch{};
  if (std::regex_match(text_rule, match, count_pattern)) {
    auto field = set_field(match.str(1));
    const auto digits = match.str(2);
    auto threshold = std::size_t{0};
    const auto [end, ec] = std::from_chars(
        digits.data(), digits.data() + digits.size(), threshold);
    if (!field || ec != std::errc{} || end != digits.data() + digits.size()) {
      return std::nullopt;
    }
    return distinct_count_t{.field = *field, .threshold = threshold};
  }
  if (std::regex_match(text_rule, match, semantic_pattern)) {
    auto left = from_string(match.str(1), kTextFieldMappings);
    auto right = from_string(match.str(2), kTextFieldMappings);
    if (!left || !right) {
      return std::nullopt;
    }
    return semantic_distance_t{.left = *left, .right = *right};
  }
  return parse_conjunction(trimmed);
}

bool is_structural(const predicate_t& predicate) {
  return !std::holds_alternative<semantic_distance_t>(predicate);
}

bool evaluate(const predicate_t& predicate, const review_context_t& context) {
  return std::visit(
      overloaded{
          [&](const not_subset_t& p) {
            const auto& right = values(context, p.right);
            return std::ranges::any_of(
                values(context, p.left), [&](const std::string& item) {
                  return std::ranges::find(right, item) == std::end(right);
                });
          },
          [&](const distinct_count_t& p) {
            const auto& items = values(context, p.field);
            const auto unique =
                std::set<std::string>{std::begin(items), std::end(items)};
            return unique.size() > p.threshold;
          },
          [&](const conjunction_t& p) {
            return !p.terms.empty() &&
                   std::ranges::all_of(p.terms, [&](const comparison_t& term) {
                     return (value(context, term.field) == term.value) ==
                            term.equal;
                   });
          },
          [&](const semantic_distance_t& p) {
            return semantic_mismatch(text(context, p.left),
                                     text(context, p.right));
          },
      },
      predicate);
}

bool semantic_mismatch(const std::string_view objective,
                       const std::string_view diff) {
  if (objective.empty() || diff.empty()) {
    return false;
  }
  const auto objective_lower = lowercase(objective);
  const auto diff_lower = lowercase(diff);

  auto terms = std::vector<std::string>{};
  auto current = std::string{};
  for (const auto c : objective_lower) {
    if (is_word(c)) {
      current.push_back(c);
      continue;
    }
    if (current.size() > 3) {
      terms.push_back(current);
    }
    current.clear();
  }
  if (current.size() > 3) {
    terms.push_back(current);
  }
  if (terms.empty()) {
    return false;
  }

  const auto matching = std::ranges::count_if(terms, [&](const std::string& t) {
    return diff_lower.find(t) != std::string::npos;
  });
  const auto ratio =
      static_cast<double>(matching) / static_cast<double>(terms.size());
  return ratio < kSemanticOverlapThreshold;
}

result<compiled_sdg_t> compile(const sdg_definition_t& definition) {
  auto violations = std::vector<std::string>{};
  if (definition.id.empty()) {
    violations.emplace_back("sdg definition has no id");
  }
  if (definition.detection_rules.empty()) {
    violations.push_back("sdg " + definition.id + " has no detection rules");
  }

  auto compiled = compiled_sdg_t{.definition = definition};
  for (const auto& rule : definition.detection_rules) {
    auto predicate = parse_detection_rule(rule);
    if (!predicate) {
      spdlog::warn("Unknown SDG rule in {}: {}", definition.id, rule);
    } else if (definition.stop_trigger && !is_structural(*predicate)) {
      violations.push_back("stop-trigger sdg " + definition.id +
                           " depends on semantic rule: " + rule);
    }
    compiled.predicates.push_back(std::move(predicate));
  }

  if (!violations.empty()) {
    auto log = "Invalid SDG definition: " + violations.front();
    return make_error(error_code::validation_error, std::move(log),
                      std::move(violations), kCodespace);
  }
  return compiled;
}

}  // namespace hap::sdg
