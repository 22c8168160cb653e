#pragma once

#include <hap/schema/attestation_block.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hap::scope {

/// Which blocks count toward one commit's coverage.
struct block_filter_t final {
  std::string sha;
  std::optional<std::string> profile;
  std::optional<std::string> path;
};

struct aggregation_t final {
  // Attested domains (`role` for v0.2 blocks, `domain` for v0.3 blocks).
  std::set<std::string> domains;
  // Matching blocks, sorted by domain then blob so the result does not
  // depend on comment order.
  std::vector<hap::schema::attestation_block_t> blocks;
};

bool matches(const hap::schema::attestation_block_t& block,
             const block_filter_t& filter);

/// Parse at most one block per comment and keep those matching `filter`.
aggregation_t aggregate(const std::vector<std::string>& comments,
                        const block_filter_t& filter);

}  // namespace hap::scope
