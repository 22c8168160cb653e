#pragma once
#include <hap/common/critical.hpp>
#include <hap/schema/encoding/encoder.hpp>
#include <hap/schema/encoding/json/attestation.hpp>
#include <hap/schema/encoding/json/decision_file.hpp>
#include <hap/schema/encoding/json/sdg_definition.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace hap::schema::encoding {

struct json_encoder_tag {};

/// JSON encoding backed by nlohmann::ordered_json.
///
/// Object members are emitted in the order the to_json overloads insert
/// them, and parsed documents keep their member order, so re-encoding a
/// decoded document reproduces the original bytes. Strings must be valid
/// UTF-8; encode throws nlohmann::json::type_error otherwise.
template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  T decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text, std::string& error);
};

template <typename T>
std::string encoder<json_encoder_tag>::encode(const T& obj) {
  auto document = nlohmann::ordered_json(obj);
  return document.dump(-1, ' ', false,
                       nlohmann::ordered_json::error_handler_t::strict);
}

template <typename T>
T encoder<json_encoder_tag>::decode(const std::string_view text) {
  auto decoded = try_decode<T>(text);
  if (!decoded) {
    hap::common::critical("failed to decode JSON document");
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const std::string_view text) {
  auto error = std::string{};
  return try_decode<T>(text, error);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const std::string_view text,
    std::string& error) {
  try {
    auto document = nlohmann::ordered_json::parse(text);
    return document.get<T>();
  } catch (const nlohmann::ordered_json::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace hap::schema::encoding
