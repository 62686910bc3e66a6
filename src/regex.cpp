#include "btregex/regex.hpp"

#include <string_view>
#include <utility>

using namespace btregex;

Regex::Regex(std::vector<MatchCase> cases, size_t n_captures)
    : m_cases{std::move(cases)}, m_n_captures{n_captures} {}

auto Regex::compile(std::string_view pattern) -> Regex {
  return btregex::compile(pattern);
}

auto Regex::test(std::string_view text, MatchConfig config) const -> bool {
  return find_matches(text, config).next().has_value();
}

auto Regex::find_matches(std::string_view text, MatchConfig config) const
    -> Matcher {
  return Matcher{m_cases, m_n_captures, text, config};
}

auto Regex::replace_all(std::string_view text, std::string_view replacement,
                        MatchConfig config) const -> ReplaceResult {
  auto matcher = find_matches(text, config);
  auto match = matcher.next();
  if (not match.has_value()) {
    return {text};
  }

  std::string result;
  size_t copied_up_to = 0;
  for (; match.has_value(); match = matcher.next()) {
    result += text.substr(copied_up_to, match->byte_offset() - copied_up_to);
    result += replacement;
    copied_up_to = match->byte_offset() + match->byte_length();
  }
  result += text.substr(copied_up_to);
  return {std::move(result)};
}

auto btregex::replace_all(std::string_view pattern, std::string_view text,
                          std::string_view replacement, MatchConfig config)
    -> ReplaceResult {
  return compile(pattern).replace_all(text, replacement, config);
}

auto btregex::matches_regex(std::string_view text, std::string_view pattern)
    -> bool {
  try {
    return compile(pattern).test(text);
  } catch (ParserError const &) {
    return false;
  }
}
