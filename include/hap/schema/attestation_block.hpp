#pragma once

#include <hap/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <variant>

// Schema type: attestation text block.
// The addressable fields of one attestation plus its blob, as posted in a
// review comment.
namespace hap::schema {

template <uint16_t Version>
struct attestation_block;

template <>
struct attestation_block<2> final {
  std::string profile;
  std::string role;
  std::string env;
  std::string path;
  std::string sha;
  content_hash_t frame_hash;
  content_hash_t disclosure_hash;
  std::string blob;
};

template <>
struct attestation_block<3> final {
  std::string profile;
  std::string domain;
  std::string env;
  std::string path;
  std::string sha;
  content_hash_t frame_hash;
  content_hash_t domain_disclosure_hash;
  std::string blob;
};

using attestation_block_v02_t = attestation_block<2>;
using attestation_block_v03_t = attestation_block<3>;
using attestation_block_t =
    std::variant<attestation_block_v02_t, attestation_block_v03_t>;

}  // namespace hap::schema
