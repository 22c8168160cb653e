#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace hap::schema {

// Wire name <-> enumerator table. Every enum that crosses a text boundary
// declares one next to its definition.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view name,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [candidate, value] : mappings) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, candidate] : mappings) {
    if (candidate == value) {
      return name;
    }
  }
  return std::nullopt;
}

// Specialised beside each enum's mapping table.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view name);

}  // namespace hap::schema
