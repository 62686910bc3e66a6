#include "btregex/common.hpp"
#include "btregex/match_case.hpp"
#include "btregex/regex.hpp"
#include "btregex/unicode.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

using namespace btregex;
using namespace std::string_view_literals;

namespace {
struct PatternCursor {
  std::string_view text;
  size_t offset;

  constexpr auto is_at_end() const -> bool { return offset >= text.size(); }

  constexpr auto remaining() const -> std::string_view {
    return text.substr(offset);
  }

  constexpr auto peek() const -> Codepoint {
    size_t size = 0;
    return parse_utf8_char(remaining(), size);
  }

  constexpr auto eat_next() -> Codepoint {
    size_t size = 0;
    auto codepoint = parse_utf8_char(remaining(), size);
    offset += size;
    return codepoint;
  }

  auto eat_or_throw(std::string_view after) -> Codepoint {
    if (is_at_end()) {
      throw ParserError("Expected character after '{}' at offset {}", after,
                        offset);
    }
    return eat_next();
  }

  auto eat_or_throw(char to_eat) -> void {
    if (try_eat(to_eat)) {
      return;
    }

    if (is_at_end()) {
      throw ParserError("Expected '{}' at offset {}, got EOF", to_eat, offset);
    }
    auto const got = codepoint_to_utf8(peek());
    throw ParserError("Expected '{}' at offset {}, got '{}'", to_eat, offset,
                      got);
  }

  constexpr auto try_eat(char to_eat) -> bool {
    if (is_next(to_eat)) {
      offset += 1;
      return true;
    }
    return false;
  }

  constexpr auto is_next(char test_char) const -> bool {
    if (is_at_end()) {
      return false;
    }
    return text[offset] == test_char;
  }

  constexpr auto is_next_digit() const -> bool {
    return not is_at_end() && text[offset] >= '0' && text[offset] <= '9';
  }
};

auto parse_number(std::string_view digits, size_t offset) -> size_t {
  if (digits.empty()) {
    throw ParserError("Expected number at offset {}", offset);
  }

  size_t result = 0;
  for (char next_char : digits) {
    if (next_char < '0' || next_char > '9') {
      throw ParserError("Expected number at offset {}, got '{}'", offset,
                        digits);
    }

    auto const digit = static_cast<size_t>(next_char - '0');
    if (result > (std::numeric_limits<size_t>::max() - digit) / 10) {
      throw ParserError("Number '{}' at offset {} is too large", digits,
                        offset);
    }
    result = result * 10 + digit;
  }
  return result;
}

auto eat_digits(PatternCursor &cursor) -> std::string_view {
  size_t const start = cursor.offset;
  while (cursor.is_next_digit()) {
    cursor.offset += 1;
  }
  return cursor.text.substr(start, cursor.offset - start);
}

// One level of parentheses. Alternatives closed by '|' wait in
// `alternatives` until the scope itself is closed.
struct Scope {
  std::vector<MatchCase> accumulator;
  std::optional<std::vector<MatchCase>> alternatives;
  std::optional<size_t> capture_id;
  size_t opened_at;
};

auto fold_branch(std::vector<MatchCase> &&cases) -> MatchCase {
  if (cases.size() == 1) {
    return std::move(cases.front());
  }
  return make_case(MatchCase::List{std::move(cases)});
}

class Compiler {
  PatternCursor m_cursor;
  std::vector<Scope> m_scopes;
  size_t m_n_captures;

  auto enter_scope(size_t offset) -> void {
    m_n_captures += 1;
    m_scopes.push_back({
        .accumulator = {},
        .alternatives = std::nullopt,
        .capture_id = m_n_captures,
        .opened_at = offset,
    });
  }

  auto close_scope() -> MatchCase {
    auto scope = std::move(m_scopes.back());
    m_scopes.pop_back();

    auto result = fold_branch(std::move(scope.accumulator));
    if (scope.alternatives.has_value()) {
      scope.alternatives->push_back(std::move(result));
      result = make_case(MatchCase::Or{std::move(*scope.alternatives)});
    }
    if (scope.capture_id.has_value()) {
      result = make_case(MatchCase::Group{
          .inner = box_case(std::move(result)),
          .capture_id = *scope.capture_id,
      });
    }
    return result;
  }

  auto close_alternative() -> void {
    auto &scope = m_scopes.back();
    if (not scope.alternatives.has_value()) {
      scope.alternatives.emplace();
    }
    scope.alternatives->push_back(fold_branch(std::move(scope.accumulator)));
    scope.accumulator.clear();
  }

  auto append(MatchCase &&match_case) -> void {
    m_scopes.back().accumulator.push_back(std::move(match_case));
  }

  auto pop_previous(char op) -> MatchCase {
    auto &accumulator = m_scopes.back().accumulator;
    if (accumulator.empty()) {
      throw ParserError("Expected pattern before '{}'", op);
    }
    auto previous = std::move(accumulator.back());
    accumulator.pop_back();
    return previous;
  }

  auto backreference(size_t capture_id, size_t offset) -> MatchCase {
    if (capture_id == 0 || capture_id > m_n_captures) {
      throw ParserError(
          "Backreference to group {} at offset {} but only {} groups are open",
          capture_id, offset, m_n_captures);
    }
    return make_case(MatchCase::Capture{capture_id});
  }

  auto parse_escape(size_t offset) -> MatchCase {
    if (m_cursor.is_next_digit()) {
      return backreference(parse_number(eat_digits(m_cursor), offset), offset);
    }

    if (m_cursor.remaining().starts_with("k<"sv)) {
      m_cursor.offset += 2;
      auto capture_id = parse_number(eat_digits(m_cursor), m_cursor.offset);
      m_cursor.eat_or_throw('>');
      return backreference(capture_id, offset);
    }

    return make_case(MatchCase::Char{m_cursor.eat_or_throw("\\"sv)});
  }

  auto parse_character_class(size_t offset) -> MatchCase {
    auto eat_class_char = [&]() -> Codepoint {
      if (m_cursor.is_at_end()) {
        throw ParserError("Unterminated character class starting at offset {}",
                          offset);
      }
      return m_cursor.eat_next();
    };
    auto eat_member_char = [&](Codepoint current) -> Codepoint {
      if (current.value == '\\') {
        return eat_class_char();
      }
      return current;
    };

    MatchCase::CharMatch char_match;

    auto current = eat_class_char();
    bool const is_complement = current.value == '^';
    if (is_complement) {
      current = eat_class_char();
    }

    while (current.value != ']') {
      auto const lower = eat_member_char(current);
      current = eat_class_char();

      if (current.value != '-') {
        char_match.members.push_back(make_case(MatchCase::Char{lower}));
        continue;
      }

      // Range
      size_t const range_end_offset = m_cursor.offset;
      auto upper = eat_class_char();
      if (upper.value == ']') {
        throw ParserError("Expected end of range in character class at offset "
                          "{}",
                          range_end_offset);
      }
      upper = eat_member_char(upper);
      char_match.members.push_back(make_case(MatchCase::Between{lower, upper}));
      current = eat_class_char();
    }

    if (is_complement) {
      return make_case(MatchCase::Not{box_case(std::move(char_match))});
    }
    return make_case(std::move(char_match));
  }

  auto parse_bound(std::string_view bound, size_t offset)
      -> std::optional<size_t> {
    if (bound.empty()) {
      return std::nullopt;
    }
    return parse_number(bound, offset);
  }

  // {m,n}, both sides optional
  auto parse_range_loop(size_t offset) -> MatchCase {
    auto previous = pop_previous('{');

    auto const rest = m_cursor.remaining();
    auto const closing = rest.find('}');
    if (closing == std::string_view::npos) {
      throw ParserError("Missing closing '}}' for repetition at offset {}",
                        offset);
    }

    auto const body = rest.substr(0, closing);
    auto const comma = body.find(',');
    if (comma == std::string_view::npos) {
      throw ParserError(
          "Repetition bounds at offset {} must be split by ',', got '{}'",
          offset, body);
    }

    auto const min = parse_bound(body.substr(0, comma), m_cursor.offset);
    auto const max =
        parse_bound(body.substr(comma + 1), m_cursor.offset + comma + 1);
    if (min.has_value() && max.has_value() && *min > *max) {
      throw ParserError(
          "Repetition minimum {} exceeds maximum {} at offset {}", *min, *max,
          offset);
    }

    m_cursor.offset += closing + 1;
    return make_case(MatchCase::RangeLoop{
        .inner = box_case(std::move(previous)),
        .min = min,
        .max = max,
    });
  }

  auto parse_quantifier(char op) -> MatchCase {
    auto previous = box_case(pop_previous(op));
    if (op == '?') {
      return make_case(MatchCase::Opt{std::move(previous)});
    }

    bool const lazy = m_cursor.try_eat('?');
    if (op == '+') {
      return make_case(MatchCase::OneOrMore{std::move(previous), lazy});
    }
    return make_case(MatchCase::Star{std::move(previous), lazy});
  }

public:
  explicit Compiler(std::string_view pattern)
      : m_cursor{.text = pattern, .offset = 0}, m_n_captures{0} {
    // The root scope never captures
    m_scopes.push_back({
        .accumulator = {},
        .alternatives = std::nullopt,
        .capture_id = std::nullopt,
        .opened_at = 0,
    });
  }

  auto compile() -> Regex {
    while (not m_cursor.is_at_end()) {
      size_t const offset = m_cursor.offset;
      auto const codepoint = m_cursor.eat_next();

      switch (codepoint.value) {
      default:
        append(make_case(MatchCase::Char{codepoint}));
        break;
      case '.':
        append(make_case(MatchCase::AnyOne{}));
        break;
      case '\\':
        append(parse_escape(offset));
        break;
      case '(':
        enter_scope(offset);
        break;
      case ')':
        if (m_scopes.size() == 1) {
          throw ParserError("Unmatched ')' at offset {}", offset);
        }
        append(close_scope());
        break;
      case '|':
        close_alternative();
        break;
      case '[':
        append(parse_character_class(offset));
        break;
      case '{':
        append(parse_range_loop(offset));
        break;
      case '?':
      case '*':
      case '+':
        append(parse_quantifier(static_cast<char>(codepoint.value)));
        break;
      case '^':
        append(make_case(MatchCase::Start{}));
        break;
      case '$':
        append(make_case(MatchCase::End{}));
        break;
      }
    }

    if (m_scopes.size() > 1) {
      throw ParserError("Missing closing ')' for group opened at offset {}",
                        m_scopes.back().opened_at);
    }

    auto &root = m_scopes.back();
    if (not root.alternatives.has_value()) {
      return Regex{std::move(root.accumulator), m_n_captures};
    }

    root.alternatives->push_back(fold_branch(std::move(root.accumulator)));
    std::vector<MatchCase> cases;
    cases.push_back(make_case(MatchCase::Or{std::move(*root.alternatives)}));
    return Regex{std::move(cases), m_n_captures};
  }
};
} // namespace

auto btregex::compile(std::string_view pattern) -> Regex {
  return Compiler{pattern}.compile();
}
