#pragma once
#include <hap/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace hap::schema::encoding {

// The wire library is a build time choice expressed through the tag type.
// Every protocol document is text, so the interface speaks std::string.
template <typename Library>
struct encoder {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  T decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text, std::string& error);
};

}  // namespace hap::schema::encoding
