#pragma once

#include "btregex/context.hpp"
#include "btregex/match_case.hpp"

#include <cstddef>
#include <optional>
#include <span>

namespace btregex::evaluation {
// Everything that still has to match after the node being evaluated. Frames
// are chained from the innermost sequence outwards and live on the stack of
// the evaluation that created them.
struct Continuation {
  std::span<MatchCase const> cases;
  Continuation const *parent = nullptr;

  // Crossing this frame leaves the group with this id
  std::optional<size_t> closes_capture = std::nullopt;
};

// On success `context` is advanced past the consumed input. On failure the
// caller must discard `context`.
auto matches(MatchCase const &, MatchContext &context,
             Continuation const &continuation) -> bool;

// Matches `cases` in order, each with the remainder of `cases` followed by
// `after` as its continuation
auto matches_sequence(std::span<MatchCase const> cases, MatchContext &context,
                      Continuation const *after) -> bool;

// Matches the whole remainder described by a continuation chain
auto matches_continuation(MatchContext &context,
                          Continuation const &continuation) -> bool;
} // namespace btregex::evaluation
