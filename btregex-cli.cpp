#include "btregex/regex.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace std::literals;

namespace {
struct Options {
  btregex::MatchConfig config;
  bool dump_ast = false;
  std::optional<std::string> pattern;
};

auto print_usage() -> void {
  std::println(std::cerr, "Usage: btregex-cli [-i|--ignore-case] [--ast] "
                          "[pattern]");
}

auto parse_options(int argc, char *argv[]) -> std::optional<Options> {
  Options options;
  for (int i = 1; i < argc; i += 1) {
    std::string_view const arg = argv[i];
    if (arg == "-h"sv || arg == "--help"sv) {
      return std::nullopt;
    }
    if (arg == "-i"sv || arg == "--ignore-case"sv) {
      options.config.case_sensitive = false;
    } else if (arg == "--ast"sv) {
      options.dump_ast = true;
    } else if (not options.pattern.has_value()) {
      options.pattern = std::string{arg};
    } else {
      std::println(std::cerr, "Unexpected argument '{}'", arg);
      return std::nullopt;
    }
  }
  return options;
}

auto strip_line_ending(std::string &line) -> void {
  while (not line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
}

auto summarize_matches(btregex::Regex const &regex, std::string_view line,
                       btregex::MatchConfig config) -> void {
  auto matcher = regex.find_matches(line, config);
  std::vector<btregex::Match> matches;
  for (auto const &match : matcher) {
    matches.push_back(match);
  }

  if (matches.empty()) {
    std::println(std::cout, "No matches");
    return;
  }

  std::println(std::cout, "=== Matches ===");
  for (size_t i = 0; i < matches.size(); i += 1) {
    auto const [start, end] = matches[i].span();
    std::println(std::cout, "{}) [{},{}]: \"{}\"", i + 1, start, end,
                 matches[i].slice());
  }

  auto const groups = matcher.groups();
  if (std::ranges::any_of(groups, [](auto group) { return not group.empty(); })) {
    std::println(std::cout, "===== Groups ======");
    for (size_t i = 0; i < groups.size(); i += 1) {
      std::println(std::cout, "{}) \"{}\"", i + 1, groups[i]);
    }
  }
  std::println(std::cout, "===================");
}
} // namespace

int main(int argc, char *argv[]) {
  auto options = parse_options(argc, argv);
  if (not options.has_value()) {
    print_usage();
    return EXIT_FAILURE;
  }

  if (not options->pattern.has_value()) {
    std::print(std::cout, "Enter a regular expression: ");
    std::cout.flush();

    std::string pattern;
    if (not std::getline(std::cin, pattern)) {
      return EXIT_FAILURE;
    }
    strip_line_ending(pattern);
    options->pattern = std::move(pattern);
  }

  auto regex = [&]() -> std::optional<btregex::Regex> {
    try {
      return btregex::compile(*options->pattern);
    } catch (btregex::ParserError const &error) {
      std::println(std::cerr, "Invalid regex: {}", error.what());
      return std::nullopt;
    }
  }();
  if (not regex.has_value()) {
    return EXIT_FAILURE;
  }

  if (options->dump_ast) {
    regex->visualize(std::cout);
  }

  std::print(std::cout, "> ");
  std::cout.flush();
  std::string line;
  while (std::getline(std::cin, line)) {
    strip_line_ending(line);
    summarize_matches(*regex, line, options->config);

    std::print(std::cout, "> ");
    std::cout.flush();
  }
  std::print(std::cout, "\n");
  return EXIT_SUCCESS;
}
