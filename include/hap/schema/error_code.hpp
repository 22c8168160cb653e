#pragma once

#include <hap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace hap::schema {

// Codes are categorical; callers branch on the code, never on the message.
enum class error_code : uint32_t {
  ok = 0,
  validation_error = 1,
  malformed_attestation = 2,
  invalid_signature = 3,
  expired = 4,
  frame_mismatch = 5,
  scope_insufficient = 6,
  unknown_profile = 7,
  unknown_execution_path = 8,
  profile_mismatch = 9,
  missing_gates = 10,
  ttl_exceeded = 11,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"OK", error_code::ok},
    std::pair<std::string_view, error_code>{"VALIDATION_ERROR",
                                            error_code::validation_error},
    std::pair<std::string_view, error_code>{"MALFORMED_ATTESTATION",
                                            error_code::malformed_attestation},
    std::pair<std::string_view, error_code>{"INVALID_SIGNATURE",
                                            error_code::invalid_signature},
    std::pair<std::string_view, error_code>{"EXPIRED", error_code::expired},
    std::pair<std::string_view, error_code>{"FRAME_MISMATCH",
                                            error_code::frame_mismatch},
    std::pair<std::string_view, error_code>{"SCOPE_INSUFFICIENT",
                                            error_code::scope_insufficient},
    std::pair<std::string_view, error_code>{"UNKNOWN_PROFILE",
                                            error_code::unknown_profile},
    std::pair<std::string_view, error_code>{"UNKNOWN_EXECUTION_PATH",
                                            error_code::unknown_execution_path},
    std::pair<std::string_view, error_code>{"PROFILE_MISMATCH",
                                            error_code::profile_mismatch},
    std::pair<std::string_view, error_code>{"MISSING_GATES",
                                            error_code::missing_gates},
    std::pair<std::string_view, error_code>{"TTL_EXCEEDED",
                                            error_code::ttl_exceeded},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("UNKNOWN");
}

}  // namespace hap::schema
