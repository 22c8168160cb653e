#pragma once

#include <hap/schema/disclosure.hpp>
#include <hap/schema/primitives.hpp>
#include <hap/schema/profile.hpp>
#include <hap/schema/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hap::disclosure {

/// Normalize a repository-relative path.
///
/// Collapses repeated separators, strips leading `./` and the trailing
/// separator. Returns std::nullopt when any segment is `..` or nothing is
/// left after normalization.
std::optional<std::string> canonicalize_path(std::string_view path);

/// Normalize every path and sort the result. Fails with `validation_error`
/// naming each rejected path.
hap::schema::result<std::vector<std::string>> canonicalize_paths(
    const std::vector<std::string>& paths);

std::vector<std::string> sort_set_field(std::vector<std::string> values);

/// Length in Unicode code points of UTF-8 text.
std::size_t text_length(std::string_view text);

std::vector<std::string> validate_disclosure(
    const hap::schema::disclosure_v02_t& disclosure,
    const hap::schema::profile_t& profile);

/// Compact JSON with sorted keys; set-valued fields sorted, paths
/// normalized.
hap::schema::result<std::string> canonical_disclosure(
    const hap::schema::disclosure_v02_t& disclosure,
    const hap::schema::profile_t& profile);

hap::schema::result<hap::schema::content_hash_t> disclosure_hash(
    const hap::schema::disclosure_v02_t& disclosure,
    const hap::schema::profile_t& profile);

std::vector<std::string> validate_domain_disclosure(
    std::string_view domain,
    const hap::schema::domain_disclosure_t& fields,
    const hap::schema::profile_t& profile);

hap::schema::result<std::string> canonical_domain_disclosure(
    std::string_view domain,
    const hap::schema::domain_disclosure_t& fields,
    const hap::schema::profile_t& profile);

hap::schema::result<hap::schema::content_hash_t> domain_disclosure_hash(
    std::string_view domain,
    const hap::schema::domain_disclosure_t& fields,
    const hap::schema::profile_t& profile);

/// One hash per disclosed domain. Each domain is canonicalized on its own,
/// so one domain's content never affects another domain's hash.
hap::schema::result<std::map<std::string, hap::schema::content_hash_t>>
domain_disclosure_hashes(const hap::schema::decision_file_t& decision_file,
                         const hap::schema::profile_t& profile);

hap::schema::result<hap::schema::decision_file_t> parse_decision_file(
    std::string_view text);

}  // namespace hap::disclosure
