#include <hap/attestation/text_block.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace hap::schema;

namespace {

constexpr auto kCodespace = "hap.attestation.block";
constexpr auto kWhitespace = std::string_view{" \t\r\n\f\v"};

using block_fields_t = std::map<std::string, std::string, std::less<>>;

std::string_view trim(std::string_view value) {
  const auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(kWhitespace);
  return value.substr(first, last - first + 1);
}

std::optional<block_fields_t> read_fields(const std::string_view body) {
  auto fields = block_fields_t{};
  auto start = std::size_t{0};
  while (start <= body.size()) {
    auto end = body.find('\n', start);
    if (end == std::string_view::npos) {
      end = body.size();
    }
    const auto line = trim(body.substr(start, end - start));
    start = end + 1;
    if (line.empty()) {
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string_view::npos) {
      return std::nullopt;
    }
    auto [_, inserted] = fields.emplace(std::string{line.substr(0, eq)},
                                        std::string{line.substr(eq + 1)});
    if (!inserted) {
      return std::nullopt;
    }
  }
  return fields;
}

// Empty when any key is absent or blank.
std::optional<std::vector<std::string>> required(
    const block_fields_t& fields,
    std::initializer_list<std::string_view> keys) {
  auto values = std::vector<std::string>{};
  values.reserve(keys.size());
  for (const auto key : keys) {
    auto it = fields.find(key);
    if (it == std::end(fields) || it->second.empty()) {
      return std::nullopt;
    }
    values.push_back(it->second);
  }
  return values;
}

hap::schema::error_t invalid(std::string reason) {
  return make_error(error_code::validation_error, reason, {reason},
                    kCodespace);
}

}  // namespace

namespace hap::attestation {

result<std::string> format_block(const attestation_block_t& block) {
  using line_t = std::pair<std::string_view, const std::string&>;
  auto lines = std::visit(
      overloaded{
          [](const attestation_block<2>& b) {
            return std::vector<line_t>{
                {"profile", b.profile},       {"role", b.role},
                {"env", b.env},               {"path", b.path},
                {"sha", b.sha},               {"frame_hash", b.frame_hash},
                {"disclosure_hash", b.disclosure_hash}, {"blob", b.blob}};
          },
          [](const attestation_block<3>& b) {
            return std::vector<line_t>{
                {"profile", b.profile},
                {"domain", b.domain},
                {"env", b.env},
                {"path", b.path},
                {"sha", b.sha},
                {"frame_hash", b.frame_hash},
                {"domain_disclosure_hash", b.domain_disclosure_hash},
                {"blob", b.blob}};
          },
      },
      block);

  // A value must come back from parse_block unchanged.
  auto violations = std::vector<std::string>{};
  for (const auto& [key, value] : lines) {
    if (value.empty()) {
      violations.push_back(std::string{key} + " is empty");
    } else if (value.find_first_of("\r\n") != std::string::npos) {
      violations.push_back(std::string{key} + " contains a line break");
    } else if (trim(value) != value) {
      violations.push_back(std::string{key} +
                           " has leading or trailing whitespace");
    } else if (value.find(kBlockBegin) != std::string::npos ||
               value.find(kBlockEnd) != std::string::npos) {
      violations.push_back(std::string{key} + " contains a block fence");
    }
  }
  if (!violations.empty()) {
    auto log = "Cannot format attestation block: " + violations.front();
    return make_error(error_code::validation_error, std::move(log),
                      std::move(violations), kCodespace);
  }

  auto out = std::string{kBlockBegin};
  for (const auto& [key, value] : lines) {
    out += "\n";
    out += key;
    out += "=";
    out += value;
  }
  out += "\n";
  out += kBlockEnd;
  return out;
}

std::optional<attestation_block_t> parse_block(const std::string_view text) {
  const auto begin = text.find(kBlockBegin);
  if (begin == std::string_view::npos) {
    return std::nullopt;
  }
  const auto body_start = begin + kBlockBegin.size();
  const auto end = text.find(kBlockEnd, body_start);
  if (end == std::string_view::npos) {
    return std::nullopt;
  }

  auto fields = read_fields(text.substr(body_start, end - body_start));
  if (!fields) {
    spdlog::debug("Ignoring attestation block with malformed lines");
    return std::nullopt;
  }

  if (fields->contains("domain") && fields->contains("domain_disclosure_hash")) {
    auto values = required(*fields, {"profile", "domain", "env", "path", "sha",
                                     "frame_hash", "domain_disclosure_hash",
                                     "blob"});
    if (!values) {
      return std::nullopt;
    }
    auto& v = *values;
    return attestation_block<3>{.profile = std::move(v[0]),
                                .domain = std::move(v[1]),
                                .env = std::move(v[2]),
                                .path = std::move(v[3]),
                                .sha = std::move(v[4]),
                                .frame_hash = std::move(v[5]),
                                .domain_disclosure_hash = std::move(v[6]),
                                .blob = std::move(v[7])};
  }

  if (fields->contains("role") && fields->contains("disclosure_hash")) {
    auto values = required(*fields, {"profile", "role", "env", "path", "sha",
                                     "frame_hash", "disclosure_hash", "blob"});
    if (!values) {
      return std::nullopt;
    }
    auto& v = *values;
    return attestation_block<2>{.profile = std::move(v[0]),
                                .role = std::move(v[1]),
                                .env = std::move(v[2]),
                                .path = std::move(v[3]),
                                .sha = std::move(v[4]),
                                .frame_hash = std::move(v[5]),
                                .disclosure_hash = std::move(v[6]),
                                .blob = std::move(v[7])};
  }
  return std::nullopt;
}

result<attestation_block_t> make_block(const attestation_t& attestation,
                                       const std::string_view blob,
                                       const hap::frame::deploy_frame_t& frame,
                                       const std::string_view domain) {
  return std::visit(
      overloaded{
          [&](const attestation_payload<2>& payload)
              -> result<attestation_block_t> {
            if (!frame.disclosure_hash) {
              return invalid("v0.2 block requires the Frame disclosure_hash");
            }
            const auto owned = std::ranges::any_of(
                payload.decision_owner_scopes,
                [&](const decision_owner_scope_t& scope) {
                  return scope.domain == domain;
                });
            if (!owned) {
              return invalid("attestation carries no scope for role " +
                             std::string{domain});
            }
            return attestation_block_t{attestation_block<2>{
                .profile = payload.profile_id,
                .role = std::string{domain},
                .env = frame.env,
                .path = frame.path,
                .sha = frame.sha,
                .frame_hash = payload.frame_hash,
                .disclosure_hash = *frame.disclosure_hash,
                .blob = std::string{blob}}};
          },
          [&](const attestation_payload<3>& payload)
              -> result<attestation_block_t> {
            auto resolved = std::ranges::find_if(
                payload.resolved_domains,
                [&](const resolved_domain_t& entry) {
                  return entry.domain == domain;
                });
            if (resolved == std::end(payload.resolved_domains)) {
              return invalid("attestation does not resolve domain " +
                             std::string{domain});
            }
            return attestation_block_t{attestation_block<3>{
                .profile = payload.profile_id,
                .domain = resolved->domain,
                .env = resolved->env,
                .path = frame.path,
                .sha = frame.sha,
                .frame_hash = payload.frame_hash,
                .domain_disclosure_hash = resolved->disclosure_hash,
                .blob = std::string{blob}}};
          },
      },
      attestation.payload);
}

const std::string& attested_domain(const attestation_block_t& block) {
  return std::visit(
      overloaded{
          [](const attestation_block<2>& b) -> const std::string& {
            return b.role;
          },
          [](const attestation_block<3>& b) -> const std::string& {
            return b.domain;
          },
      },
      block);
}

}  // namespace hap::attestation
