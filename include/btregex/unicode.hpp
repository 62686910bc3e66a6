#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace btregex {
struct Codepoint {
  unsigned value;

  constexpr auto operator==(Codepoint const &) const -> bool = default;
  constexpr auto operator<=>(Codepoint const &) const = default;

  static constexpr auto invalid_sentinel() -> Codepoint { return {0xfffdU}; };

  // A Unicode scalar: in range and not a surrogate
  constexpr auto is_scalar() const -> bool {
    return value <= 0x10ffffU && (value < 0xd800U || value > 0xdfffU);
  }
};

// Decodes the first scalar of `text` (which must not be empty) and writes the
// number of bytes consumed to `size`. Malformed, truncated or overlong
// sequences, surrogates and values past U+10FFFF decode to the replacement
// character and consume a single byte.
constexpr auto parse_utf8_char(std::string_view text, size_t &size)
    -> Codepoint {
  size = 1;
  unsigned const first_byte = static_cast<uint8_t>(text[0]);
  if ((first_byte & 0x80U) == 0U) {
    // ASCII range
    return {first_byte};
  }

  size_t length;
  unsigned value;
  unsigned shortest_form;
  if ((first_byte & 0xe0U) == 0xc0U) {
    length = 2;
    value = first_byte & 0x1fU;
    shortest_form = 0x80U;
  } else if ((first_byte & 0xf0U) == 0xe0U) {
    length = 3;
    value = first_byte & 0x0fU;
    shortest_form = 0x800U;
  } else if ((first_byte & 0xf8U) == 0xf0U) {
    length = 4;
    value = first_byte & 0x07U;
    shortest_form = 0x10000U;
  } else {
    return Codepoint::invalid_sentinel();
  }

  if (text.size() < length) {
    return Codepoint::invalid_sentinel();
  }
  for (size_t i = 1; i < length; i += 1) {
    unsigned const continuation = static_cast<uint8_t>(text[i]);
    if ((continuation & 0xc0U) != 0x80U) {
      return Codepoint::invalid_sentinel();
    }
    value = (value << 6U) | (continuation & 0x3fU);
  }

  Codepoint const decoded{value};
  if (value < shortest_form || not decoded.is_scalar()) {
    return Codepoint::invalid_sentinel();
  }
  size = length;
  return decoded;
}

constexpr auto is_valid_utf8(std::string_view text) -> bool {
  size_t offset = 0;
  while (offset < text.size()) {
    size_t size = 0;
    auto codepoint = parse_utf8_char(text.substr(offset), size);
    if (codepoint == Codepoint::invalid_sentinel() &&
        text.substr(offset, size) != "\xef\xbf\xbd") {
      return false;
    }
    offset += size;
  }
  return true;
}

constexpr auto codepoint_count(std::string_view text) -> size_t {
  size_t count = 0;
  size_t offset = 0;
  while (offset < text.size()) {
    size_t size = 0;
    parse_utf8_char(text.substr(offset), size);
    offset += size;
    count += 1;
  }
  return count;
}

// Anything that isn't a scalar is written as the replacement character
constexpr auto codepoint_to_utf8(std::string &output, Codepoint codepoint)
    -> void {
  unsigned const value = codepoint.is_scalar()
                             ? codepoint.value
                             : Codepoint::invalid_sentinel().value;

  auto const continuation_byte = [](unsigned bits) -> char {
    return static_cast<char>(0x80U | (bits & 0x3fU));
  };

  if (value < 0x80U) [[likely]] {
    output.push_back(static_cast<char>(value));
  } else if (value < 0x800U) {
    output.push_back(static_cast<char>(0xc0U | (value >> 6U)));
    output.push_back(continuation_byte(value));
  } else if (value < 0x10000U) {
    output.push_back(static_cast<char>(0xe0U | (value >> 12U)));
    output.push_back(continuation_byte(value >> 6U));
    output.push_back(continuation_byte(value));
  } else {
    output.push_back(static_cast<char>(0xf0U | (value >> 18U)));
    output.push_back(continuation_byte(value >> 12U));
    output.push_back(continuation_byte(value >> 6U));
    output.push_back(continuation_byte(value));
  }
}

inline auto codepoint_to_utf8(Codepoint codepoint) -> std::string {
  std::string output;
  codepoint_to_utf8(output, codepoint);
  return output;
}

// Simple one-to-one lowercase mapping. Covers ASCII, Latin-1, Latin
// Extended-A, Greek and Cyrillic; everything else folds to itself.
constexpr auto to_lower(Codepoint codepoint) -> Codepoint {
  unsigned const c = codepoint.value;
  if (c < 0x80U) {
    if (c >= 'A' && c <= 'Z') {
      return {c + 0x20U};
    }
    return codepoint;
  }

  // Latin-1 Supplement, excluding the multiplication sign
  if (c >= 0xc0U && c <= 0xdeU && c != 0xd7U) {
    return {c + 0x20U};
  }

  // Latin Extended-A: upper/lower pairs alternate
  if (c == 0x130U) {
    return {'i'};
  }
  if (c >= 0x100U && c <= 0x137U) {
    return {c | 1U};
  }
  if (c >= 0x139U && c <= 0x148U) {
    return {(c & 1U) != 0U ? c + 1U : c};
  }
  if (c >= 0x14aU && c <= 0x177U) {
    return {c | 1U};
  }
  if (c == 0x178U) {
    return {0xffU};
  }
  if (c >= 0x179U && c <= 0x17eU) {
    return {(c & 1U) != 0U ? c + 1U : c};
  }

  // Greek, excluding the unassigned 0x3a2
  if (c >= 0x391U && c <= 0x3abU && c != 0x3a2U) {
    return {c + 0x20U};
  }

  // Cyrillic
  if (c >= 0x400U && c <= 0x40fU) {
    return {c + 0x50U};
  }
  if (c >= 0x410U && c <= 0x42fU) {
    return {c + 0x20U};
  }
  return codepoint;
}

constexpr auto fold_case(Codepoint codepoint, bool case_sensitive)
    -> Codepoint {
  return case_sensitive ? codepoint : to_lower(codepoint);
}
} // namespace btregex
