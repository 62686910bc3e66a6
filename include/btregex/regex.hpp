#pragma once

#include "common.hpp"
#include "context.hpp"
#include "match_case.hpp"
#include "matcher.hpp"

#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace btregex {
// Holds the caller's input (no copy) when nothing was replaced
using ReplaceResult = std::variant<std::string_view, std::string>;

constexpr auto replaced_text(ReplaceResult const &result) -> std::string_view {
  return std::visit([](auto const &text) -> std::string_view { return text; },
                    result);
}

// An immutable compiled pattern
class Regex {
  std::vector<MatchCase> m_cases;
  size_t m_n_captures;

public:
  Regex(std::vector<MatchCase> cases, size_t n_captures);

  // Throws ParserError
  static auto compile(std::string_view pattern) -> Regex;

  [[nodiscard]] auto test(std::string_view text, MatchConfig config = {}) const
      -> bool;
  [[nodiscard]] auto find_matches(std::string_view text,
                                  MatchConfig config = {}) const -> Matcher;
  [[nodiscard]] auto replace_all(std::string_view text,
                                 std::string_view replacement,
                                 MatchConfig config = {}) const
      -> ReplaceResult;

  auto n_captures() const -> size_t { return m_n_captures; }
  auto cases() const -> std::span<MatchCase const> { return m_cases; }

  auto visualize(std::ostream &) const -> void;

  Regex(Regex &&) = default;
  auto operator=(Regex &&) -> Regex & = default;
};

auto compile(std::string_view pattern) -> Regex;

auto replace_all(std::string_view pattern, std::string_view text,
                 std::string_view replacement, MatchConfig config = {})
    -> ReplaceResult;

// False when the pattern doesn't compile
auto matches_regex(std::string_view text, std::string_view pattern) -> bool;
} // namespace btregex
