#pragma once

#include <hap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: deployment environment a Frame targets.
namespace hap::schema {

enum class environment_t : uint8_t { prod = 0, staging = 1 };

inline constexpr auto kEnvironmentMappings = std::array{
    std::pair<std::string_view, environment_t>{"prod", environment_t::prod},
    std::pair<std::string_view, environment_t>{"staging",
                                               environment_t::staging},
};

template <>
inline std::optional<environment_t> try_from_string<environment_t>(
    const std::string_view value) {
  return from_string(value, kEnvironmentMappings);
}

inline constexpr std::string_view to_string(const environment_t value) {
  return to_string(value, kEnvironmentMappings).value_or("unknown");
}

}  // namespace hap::schema
