#include <hap/common/critical.hpp>
#include <hap/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace hap::schema {

namespace {

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

struct base64_alphabet_t final {
  std::string_view table;
  bool pad{true};
};

constexpr auto kBase64 = base64_alphabet_t{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/", true};
constexpr auto kBase64Url = base64_alphabet_t{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_", false};

std::string encode_base64(const bytes_view_t& bytes,
                          const base64_alphabet_t& alphabet) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (std::size_t i = 0; i < bytes.size(); i += 3) {
    const auto remaining = std::min<std::size_t>(3, bytes.size() - i);
    auto group = static_cast<uint32_t>(bytes[i]) << 16u;
    if (remaining > 1) {
      group |= static_cast<uint32_t>(bytes[i + 1]) << 8u;
    }
    if (remaining > 2) {
      group |= static_cast<uint32_t>(bytes[i + 2]);
    }
    for (auto k = std::size_t{0}; k < 4; ++k) {
      if (k <= remaining) {
        out.push_back(alphabet.table[(group >> (18u - (6u * k))) & 0x3Fu]);
      } else if (alphabet.pad) {
        out.push_back('=');
      }
    }
  }
  return out;
}

// Expects whitespace already removed. At most two trailing '=' are accepted.
std::optional<bytes_t> decode_base64(std::string_view encoded,
                                     const base64_alphabet_t& alphabet) {
  for (auto padding = 0; padding < 2 && !encoded.empty() &&
                         encoded.back() == '=';
       ++padding) {
    encoded.remove_suffix(1);
  }
  if ((encoded.size() % 4) == 1) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((encoded.size() * 3) / 4);
  auto buffer = uint32_t{0};
  auto bits = 0u;
  for (const auto ch : encoded) {
    const auto value = alphabet.table.find(ch);
    if (value == std::string_view::npos) {
      return std::nullopt;
    }
    buffer = ((buffer << 6u) | static_cast<uint32_t>(value)) & 0xFFFFFFu;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFFu));
    }
  }
  if ((buffer & ((1u << bits) - 1u)) != 0) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    hap::common::critical("invalid hex input");
  }
  return *decoded;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

std::string to_base64(const bytes_view_t& bytes) {
  return encode_base64(bytes, kBase64);
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::ranges::copy_if(encoded, std::back_inserter(compact), [](char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) == 0;
  });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }
  return decode_base64(compact, kBase64);
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    hap::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::string to_base64url(const bytes_view_t& bytes) {
  return encode_base64(bytes, kBase64Url);
}

std::optional<bytes_t> try_from_base64url(const std::string_view encoded) {
  return decode_base64(encoded, kBase64Url);
}

bool is_valid_utf8(const std::string_view text) {
  auto i = std::size_t{0};
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80u) {
      ++i;
      continue;
    }

    auto length = std::size_t{0};
    auto code_point = uint32_t{0};
    auto minimum = uint32_t{0};
    if ((lead & 0xE0u) == 0xC0u) {
      length = 2;
      code_point = lead & 0x1Fu;
      minimum = 0x80u;
    } else if ((lead & 0xF0u) == 0xE0u) {
      length = 3;
      code_point = lead & 0x0Fu;
      minimum = 0x800u;
    } else if ((lead & 0xF8u) == 0xF0u) {
      length = 4;
      code_point = lead & 0x07u;
      minimum = 0x10000u;
    } else {
      return false;
    }
    if (text.size() - i < length) {
      return false;
    }
    for (auto k = std::size_t{1}; k < length; ++k) {
      const auto next = static_cast<uint8_t>(text[i + k]);
      if ((next & 0xC0u) != 0x80u) {
        return false;
      }
      code_point = (code_point << 6u) | (next & 0x3Fu);
    }
    if (code_point < minimum || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
      return false;
    }
    i += length;
  }
  return true;
}

}  // namespace hap::schema
