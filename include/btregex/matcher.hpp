#pragma once

#include "context.hpp"
#include "match_case.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace btregex {

class Match {
  size_t m_char_offset;
  size_t m_byte_offset;
  std::string_view m_slice;

public:
  constexpr Match(size_t char_offset, size_t byte_offset,
                  std::string_view slice)
      : m_char_offset{char_offset}, m_byte_offset{byte_offset},
        m_slice{slice} {}

  // [start, end) in characters
  constexpr auto span() const -> std::pair<size_t, size_t> {
    return {m_char_offset, m_char_offset + codepoint_count(m_slice)};
  }
  constexpr auto slice() const -> std::string_view { return m_slice; }

  constexpr auto byte_offset() const -> size_t { return m_byte_offset; }
  constexpr auto byte_length() const -> size_t { return m_slice.size(); }

  constexpr auto operator==(Match const &other) const -> bool {
    return m_char_offset == other.m_char_offset &&
           m_byte_offset == other.m_byte_offset && m_slice == other.m_slice;
  }
};

// Lazily scans the input for non-overlapping matches, left to right
class Matcher {
  std::span<MatchCase const> m_cases;
  MatchContext m_context;
  std::vector<std::string_view> m_groups;
  bool m_is_exhausted;

public:
  Matcher(std::span<MatchCase const> cases, size_t n_captures,
          std::string_view text, MatchConfig config);

  auto next() -> std::optional<Match>;

  // Capture state as of the most recent match, index 0 is group 1. The span
  // stays valid for the matcher's lifetime; later calls to next() overwrite
  // its contents in place.
  auto groups() const -> std::span<std::string_view const> { return m_groups; }

  class Iterator {
    Matcher *m_matcher;
    std::optional<Match> m_current;

  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Match;
    using difference_type = std::ptrdiff_t;

    Iterator() : m_matcher{nullptr} {}
    explicit Iterator(Matcher &matcher)
        : m_matcher{&matcher}, m_current{matcher.next()} {}

    auto operator*() const -> Match const & { return *m_current; }
    auto operator->() const -> Match const * { return &*m_current; }

    auto operator++() -> Iterator & {
      m_current = m_matcher->next();
      return *this;
    }
    auto operator++(int) -> void { ++*this; }

    auto operator==(std::default_sentinel_t) const -> bool {
      return not m_current.has_value();
    }
  };

  auto begin() -> Iterator { return Iterator{*this}; }
  auto end() -> std::default_sentinel_t { return std::default_sentinel; }
};
} // namespace btregex
