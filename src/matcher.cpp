#include "btregex/matcher.hpp"

#include "private/evaluation.hpp"

#include <algorithm>
#include <utility>

using namespace btregex;

Matcher::Matcher(std::span<MatchCase const> cases, size_t n_captures,
                 std::string_view text, MatchConfig config)
    : m_cases{cases}, m_context{text, n_captures, config},
      m_groups(n_captures), m_is_exhausted{false} {}

auto Matcher::next() -> std::optional<Match> {
  if (m_is_exhausted) {
    return std::nullopt;
  }

  while (true) {
    auto trial = m_context;
    if (evaluation::matches_sequence(m_cases, trial, nullptr)) {
      auto const &start = m_context.cursor();
      Match result{start.char_offset(), start.byte_offset(),
                   start.slice_to(trial.cursor())};

      // The next scan resumes right after this match
      m_context = std::move(trial);
      std::ranges::copy(m_context.captures(), m_groups.begin());
      if (result.byte_length() == 0) {
        if (m_context.is_at_end()) {
          m_is_exhausted = true;
        } else {
          m_context.next_char();
        }
      }
      return result;
    }

    if (m_context.is_at_end()) {
      m_is_exhausted = true;
      return std::nullopt;
    }
    m_context.next_char();
  }
}
