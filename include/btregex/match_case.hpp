#pragma once

#include "unicode.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace btregex {
// A compiled pattern is a tree of match cases. Every node owns its children;
// nothing is shared and nothing is mutated after the compiler hands it over.
struct MatchCase {
  // Zero-width anchors
  struct Start {};
  struct End {};

  // Single character conditions, each consumes exactly one character
  struct Char {
    Codepoint value;
  };
  struct AnyOne {};
  struct Between {
    Codepoint lower;
    Codepoint upper;
  };

  // [...]: members are Char or Between
  struct CharMatch {
    std::vector<MatchCase> members;
  };
  // [^...]: only ever wraps a CharMatch
  struct Not {
    std::unique_ptr<MatchCase> inner;
  };

  struct List {
    std::vector<MatchCase> cases;
  };
  struct Or {
    std::vector<MatchCase> branches;
  };

  struct Opt {
    std::unique_ptr<MatchCase> inner;
  };
  struct OneOrMore {
    std::unique_ptr<MatchCase> inner;
    bool lazy;
  };
  struct Star {
    std::unique_ptr<MatchCase> inner;
    bool lazy;
  };
  // {min,max}, either side may be unbounded. There is no lazy form.
  struct RangeLoop {
    std::unique_ptr<MatchCase> inner;
    std::optional<size_t> min;
    std::optional<size_t> max;
  };

  // capture_id is 1-based, in order of the opening parentheses
  struct Group {
    std::unique_ptr<MatchCase> inner;
    size_t capture_id;
  };
  // Backreference to the current text of a group
  struct Capture {
    size_t capture_id;
  };

  using MatchCaseVariant =
      std::variant<Start, End, Char, AnyOne, Between, CharMatch, Not, List, Or,
                   Opt, OneOrMore, Star, RangeLoop, Group, Capture>;

  MatchCaseVariant type;
};

template <typename T> auto make_case(T &&node) -> MatchCase {
  return MatchCase{{std::forward<T>(node)}};
}

template <typename T> auto box_case(T &&node) -> std::unique_ptr<MatchCase> {
  return std::make_unique<MatchCase>(make_case(std::forward<T>(node)));
}

inline auto box_case(MatchCase &&node) -> std::unique_ptr<MatchCase> {
  return std::make_unique<MatchCase>(std::move(node));
}
} // namespace btregex
