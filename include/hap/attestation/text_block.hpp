#pragma once

#include <hap/frame/canonical.hpp>
#include <hap/schema/attestation.hpp>
#include <hap/schema/attestation_block.hpp>
#include <hap/schema/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace hap::attestation {

inline constexpr auto kBlockBegin =
    std::string_view{"---BEGIN HAP_ATTESTATION v=1---"};
inline constexpr auto kBlockEnd = std::string_view{"---END HAP_ATTESTATION---"};

/// Fenced `key=value` rendering in the fixed per-version key order.
///
/// Fails with `validation_error` for any value `parse_block` would not read
/// back unchanged: empty, containing a line break or a fence, or padded with
/// whitespace. `=` inside a value is fine, keys end at the first one.
hap::schema::result<std::string> format_block(const hap::schema::attestation_block_t& block);

/// First block found in `text`.
///
/// Returns std::nullopt when no fenced block exists, a line lacks `=`, a key
/// repeats, the version cannot be detected, or a required key is empty.
/// Ordinary comments never contain a block, so absence is not an error.
std::optional<hap::schema::attestation_block_t> parse_block(
    std::string_view text);

/// Block for the reviewer of `domain`. For v0.2 the domain is written as the
/// block's role and the disclosure hash comes from the Frame.
hap::schema::result<hap::schema::attestation_block_t> make_block(
    const hap::schema::attestation_t& attestation,
    std::string_view blob,
    const hap::frame::deploy_frame_t& frame,
    std::string_view domain);

/// `role` of a v0.2 block, `domain` of a v0.3 block.
const std::string& attested_domain(const hap::schema::attestation_block_t& block);

}  // namespace hap::attestation
