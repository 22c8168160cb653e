#include <hap/attestation/text_block.hpp>
#include <hap/schema/primitives.hpp>
#include <hap/scope/aggregation.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <tuple>

using namespace hap::schema;

namespace {

using block_key_t = std::tuple<const std::string&,
                               const std::string&,
                               const std::string&,
                               const std::string&,
                               const std::string&,
                               const std::string&,
                               const std::string&,
                               const std::string&,
                               std::size_t>;

// Every field of the block, so distinct blocks never compare equal.
block_key_t sort_key(const attestation_block_t& block) {
  return std::visit(
      overloaded{
          [&](const attestation_block<2>& b) {
            return block_key_t{b.role,     b.blob, b.profile,
                               b.path,     b.env,  b.sha,
                               b.frame_hash, b.disclosure_hash, block.index()};
          },
          [&](const attestation_block<3>& b) {
            return block_key_t{b.domain,   b.blob, b.profile,
                               b.path,     b.env,  b.sha,
                               b.frame_hash, b.domain_disclosure_hash,
                               block.index()};
          },
      },
      block);
}

}  // namespace

namespace hap::scope {

bool matches(const attestation_block_t& block, const block_filter_t& filter) {
  return std::visit(
      [&](const auto& b) {
        if (b.sha != filter.sha) {
          return false;
        }
        if (filter.profile && b.profile != *filter.profile) {
          return false;
        }
        if (filter.path && b.path != *filter.path) {
          return false;
        }
        return true;
      },
      block);
}

aggregation_t aggregate(const std::vector<std::string>& comments,
                        const block_filter_t& filter) {
  auto out = aggregation_t{};
  for (const auto& comment : comments) {
    auto block = hap::attestation::parse_block(comment);
    if (!block || !matches(*block, filter)) {
      continue;
    }
    out.domains.insert(hap::attestation::attested_domain(*block));
    out.blocks.push_back(std::move(*block));
  }

  std::ranges::sort(out.blocks, [](const attestation_block_t& lhs,
                                   const attestation_block_t& rhs) {
    return sort_key(lhs) < sort_key(rhs);
  });
  spdlog::debug("Aggregated {} attestation block(s) for {} from {} comment(s)",
                out.blocks.size(), filter.sha, comments.size());
  return out;
}

}  // namespace hap::scope
