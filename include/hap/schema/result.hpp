#pragma once

#include <hap/common/critical.hpp>
#include <hap/schema/error_code.hpp>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hap::schema {

/// Failure detail carried by every protocol operation.
///
/// `violations` lists every problem found, not just the first, so input can
/// be fixed in one pass. `codespace` names the operation that failed.
struct error_t final {
  error_code code{error_code::ok};
  std::string log;
  std::vector<std::string> violations;
  std::string codespace;
};

inline error_t make_error(const error_code code,
                          std::string log,
                          std::vector<std::string> violations,
                          std::string codespace) {
  return error_t{.code = code,
                 .log = std::move(log),
                 .violations = std::move(violations),
                 .codespace = std::move(codespace)};
}

template <typename T>
class result final {
 public:
  result(T value) : value_{std::move(value)} {}
  result(error_t error) : value_{std::move(error)} {}

  bool ok() const { return std::holds_alternative<T>(value_); }
  explicit operator bool() const { return ok(); }

  error_code code() const {
    return ok() ? error_code::ok : std::get<error_t>(value_).code;
  }

  const T& value() const& {
    if (!ok()) {
      hap::common::critical("result::value called on an error result");
    }
    return std::get<T>(value_);
  }

  T& value() & {
    if (!ok()) {
      hap::common::critical("result::value called on an error result");
    }
    return std::get<T>(value_);
  }

  T&& value() && {
    if (!ok()) {
      hap::common::critical("result::value called on an error result");
    }
    return std::get<T>(std::move(value_));
  }

  const error_t& error() const {
    if (ok()) {
      hap::common::critical("result::error called on a success result");
    }
    return std::get<error_t>(value_);
  }

 private:
  std::variant<T, error_t> value_;
};

using status_t = result<std::monostate>;

inline status_t ok_status() {
  return status_t{std::monostate{}};
}

}  // namespace hap::schema
