#include "btregex/regex.hpp"

#include <cstddef>
#include <format>
#include <optional>
#include <ostream>
#include <print>
#include <string>
#include <variant>
#include <vector>

using namespace btregex;

namespace {
auto pretty_format(Codepoint codepoint) -> std::string {
  return std::format("'{}'", codepoint_to_utf8(codepoint));
}

auto pretty_format(std::optional<size_t> bound) -> std::string {
  if (not bound.has_value()) {
    return "_";
  }
  return std::format("{}", *bound);
}

auto print_tree(std::ostream &out_stream, MatchCase const &match_case,
                size_t depth) -> void;

auto print_children(std::ostream &out_stream,
                    std::vector<MatchCase> const &children, size_t depth)
    -> void {
  for (auto const &child : children) {
    print_tree(out_stream, child, depth);
  }
}

auto print_tree(std::ostream &out_stream, MatchCase const &match_case,
                size_t depth) -> void {
  std::string const indent(depth * 2, ' ');
  auto line = [&](std::string const &label) {
    std::print(out_stream, "{}{}\n", indent, label);
  };

  std::visit(
      Overload{
          [&](MatchCase::Start) { line("Start"); },
          [&](MatchCase::End) { line("End"); },
          [&](MatchCase::AnyOne) { line("AnyOne"); },
          [&](MatchCase::Char node) {
            line(std::format("Char {}", pretty_format(node.value)));
          },
          [&](MatchCase::Between node) {
            line(std::format("Between {} {}", pretty_format(node.lower),
                             pretty_format(node.upper)));
          },
          [&](MatchCase::Capture node) {
            line(std::format("Capture {}", node.capture_id));
          },
          [&](MatchCase::CharMatch const &node) {
            line("CharMatch");
            print_children(out_stream, node.members, depth + 1);
          },
          [&](MatchCase::List const &node) {
            line("List");
            print_children(out_stream, node.cases, depth + 1);
          },
          [&](MatchCase::Or const &node) {
            line("Or");
            print_children(out_stream, node.branches, depth + 1);
          },
          [&](MatchCase::Not const &node) {
            line("Not");
            print_tree(out_stream, *node.inner, depth + 1);
          },
          [&](MatchCase::Opt const &node) {
            line("Opt");
            print_tree(out_stream, *node.inner, depth + 1);
          },
          [&](MatchCase::OneOrMore const &node) {
            line(node.lazy ? "OneOrMore lazy" : "OneOrMore");
            print_tree(out_stream, *node.inner, depth + 1);
          },
          [&](MatchCase::Star const &node) {
            line(node.lazy ? "Star lazy" : "Star");
            print_tree(out_stream, *node.inner, depth + 1);
          },
          [&](MatchCase::RangeLoop const &node) {
            line(std::format("RangeLoop {{{},{}}}", pretty_format(node.min),
                             pretty_format(node.max)));
            print_tree(out_stream, *node.inner, depth + 1);
          },
          [&](MatchCase::Group const &node) {
            line(std::format("Group {}", node.capture_id));
            print_tree(out_stream, *node.inner, depth + 1);
          },
      },
      match_case.type);
}
} // namespace

auto Regex::visualize(std::ostream &out_stream) const -> void {
  std::print(out_stream, "Regex ({} groups)\n", m_n_captures);
  for (auto const &match_case : m_cases) {
    print_tree(out_stream, match_case, 1);
  }
}
