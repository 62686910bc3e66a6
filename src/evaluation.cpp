#include "private/evaluation.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

using namespace btregex;
using namespace btregex::evaluation;

namespace {
// A repetition that consumed nothing can be repeated forever. Loops treat it
// the same as a failed repetition.
inline auto made_progress(MatchContext const &before, MatchContext const &after)
    -> bool {
  return after.char_offset() != before.char_offset();
}

auto evaluate_case(MatchCase::Start const &, MatchContext &context,
                   Continuation const &) -> bool {
  return context.char_offset() == 0;
}

auto evaluate_case(MatchCase::End const &, MatchContext &context,
                   Continuation const &) -> bool {
  return context.is_at_end();
}

auto evaluate_case(MatchCase::Char const &expected, MatchContext &context,
                   Continuation const &) -> bool {
  auto codepoint = context.next_char();
  if (not codepoint.has_value()) {
    return false;
  }
  return context.fold(*codepoint) == context.fold(expected.value);
}

auto evaluate_case(MatchCase::AnyOne const &, MatchContext &context,
                   Continuation const &) -> bool {
  return context.next_char().has_value();
}

auto evaluate_case(MatchCase::Between const &range, MatchContext &context,
                   Continuation const &) -> bool {
  auto codepoint = context.next_char();
  if (not codepoint.has_value()) {
    return false;
  }
  auto const folded = context.fold(*codepoint);
  return context.fold(range.lower) <= folded &&
         folded <= context.fold(range.upper);
}

auto evaluate_case(MatchCase::CharMatch const &char_match,
                   MatchContext &context, Continuation const &continuation)
    -> bool {
  for (auto const &member : char_match.members) {
    // Membership test only, the real cursor advances below
    auto probe = context;
    if (matches(member, probe, continuation)) {
      context.next_char();
      return true;
    }
  }
  return false;
}

auto evaluate_case(MatchCase::Not const &negation, MatchContext &context,
                   Continuation const &continuation) -> bool {
  if (context.is_at_end()) {
    return false;
  }

  // The negated class still consumes exactly one character
  auto probe = context;
  bool const inner_matched = matches(*negation.inner, probe, continuation);
  context.next_char();
  return not inner_matched;
}

auto evaluate_case(MatchCase::List const &list, MatchContext &context,
                   Continuation const &continuation) -> bool {
  return matches_sequence(list.cases, context, &continuation);
}

auto evaluate_case(MatchCase::Or const &alternation, MatchContext &context,
                   Continuation const &continuation) -> bool {
  // First local success wins, the continuation is not consulted
  for (auto const &branch : alternation.branches) {
    auto trial = context;
    if (matches(branch, trial, continuation)) {
      context = std::move(trial);
      return true;
    }
  }
  return false;
}

auto evaluate_case(MatchCase::Opt const &optional, MatchContext &context,
                   Continuation const &continuation) -> bool {
  auto trial = context;
  if (matches(*optional.inner, trial, continuation)) {
    auto lookahead = trial;
    if (matches_continuation(lookahead, continuation)) {
      context = std::move(trial);
    }
  }
  return true;
}

auto greedy_star_loop(MatchCase const &inner, MatchContext &context,
                      Continuation const &continuation) -> bool {
  std::optional<MatchContext> last_stop;
  while (true) {
    {
      auto lookahead = context;
      if (matches_continuation(lookahead, continuation)) {
        last_stop = context;
      }
    }

    auto trial = context;
    if (matches(inner, trial, continuation) && made_progress(context, trial)) {
      context = std::move(trial);
      context.update_open_captures();
      continue;
    }

    if (last_stop.has_value()) {
      context = std::move(*last_stop);
    }
    return true;
  }
}

auto lazy_star_loop(MatchCase const &inner, MatchContext &context,
                    Continuation const &continuation) -> bool {
  while (true) {
    {
      auto lookahead = context;
      if (matches_continuation(lookahead, continuation)) {
        return true;
      }
    }

    auto trial = context;
    if (not matches(inner, trial, continuation) ||
        not made_progress(context, trial)) {
      return true;
    }
    context = std::move(trial);
    context.update_open_captures();
  }
}

auto star_loop(MatchCase const &inner, bool lazy, MatchContext &context,
               Continuation const &continuation) -> bool {
  context.update_open_captures();
  if (lazy) {
    return lazy_star_loop(inner, context, continuation);
  }
  return greedy_star_loop(inner, context, continuation);
}

auto evaluate_case(MatchCase::OneOrMore const &repeat, MatchContext &context,
                   Continuation const &continuation) -> bool {
  if (not matches(*repeat.inner, context, continuation)) {
    return false;
  }
  return star_loop(*repeat.inner, repeat.lazy, context, continuation);
}

auto evaluate_case(MatchCase::Star const &repeat, MatchContext &context,
                   Continuation const &continuation) -> bool {
  return star_loop(*repeat.inner, repeat.lazy, context, continuation);
}

auto evaluate_case(MatchCase::RangeLoop const &repeat, MatchContext &context,
                   Continuation const &continuation) -> bool {
  size_t const min = repeat.min.value_or(0);
  for (size_t i = 0; i < min; i += 1) {
    if (not matches(*repeat.inner, context, continuation)) {
      return false;
    }
  }

  // Always greedy, and no lookahead against the continuation
  size_t count = min;
  while (not repeat.max.has_value() || count < *repeat.max) {
    auto trial = context;
    if (not matches(*repeat.inner, trial, continuation) ||
        not made_progress(context, trial)) {
      break;
    }
    context = std::move(trial);
    count += 1;
  }
  return true;
}

auto evaluate_case(MatchCase::Group const &group, MatchContext &context,
                   Continuation const &continuation) -> bool {
  Continuation const group_exit{
      .cases = {},
      .parent = &continuation,
      .closes_capture = group.capture_id,
  };

  context.push_capture(group.capture_id);
  bool const did_match = matches(*group.inner, context, group_exit);
  context.update_open_captures();
  context.pop_capture();
  return did_match;
}

auto evaluate_case(MatchCase::Capture const &reference, MatchContext &context,
                   Continuation const &) -> bool {
  auto const captured = context.capture(reference.capture_id);

  size_t offset = 0;
  while (offset < captured.size()) {
    size_t size = 0;
    auto const expected = parse_utf8_char(captured.substr(offset), size);
    offset += size;

    auto codepoint = context.next_char();
    if (not codepoint.has_value() ||
        context.fold(*codepoint) != context.fold(expected)) {
      return false;
    }
  }
  return true;
}
} // namespace

auto btregex::evaluation::matches(MatchCase const &match_case,
                                  MatchContext &context,
                                  Continuation const &continuation) -> bool {
  return std::visit(
      [&](auto const &type) {
        return evaluate_case(type, context, continuation);
      },
      match_case.type);
}

auto btregex::evaluation::matches_sequence(std::span<MatchCase const> cases,
                                           MatchContext &context,
                                           Continuation const *after) -> bool {
  for (size_t i = 0; i < cases.size(); i += 1) {
    Continuation const rest{.cases = cases.subspan(i + 1), .parent = after};
    if (not matches(cases[i], context, rest)) {
      return false;
    }
  }
  return true;
}

auto btregex::evaluation::matches_continuation(
    MatchContext &context, Continuation const &continuation) -> bool {
  for (auto const *frame = &continuation; frame != nullptr;
       frame = frame->parent) {
    if (not matches_sequence(frame->cases, context, frame->parent)) {
      return false;
    }
    if (frame->closes_capture.has_value()) {
      context.update_open_captures();
      context.pop_capture();
    }
  }
  return true;
}
