#include "btregex/c_api.h"

#include "btregex/regex.hpp"

#include <new>
#include <string_view>

using namespace btregex;

struct btregex_regex {
  Regex regex;
};

struct btregex_matcher {
  Matcher matcher;
};

namespace {
auto to_config(btregex_config config) -> MatchConfig {
  return MatchConfig{.case_sensitive = config.case_sensitive};
}

constexpr btregex_config default_config{.case_sensitive = true};
} // namespace

auto btregex_compile(char const *pattern) -> btregex_regex * {
  std::string_view const pattern_view{pattern};
  if (not is_valid_utf8(pattern_view)) {
    return nullptr;
  }

  try {
    return new btregex_regex{Regex::compile(pattern_view)};
  } catch (ParserError const &) {
    return nullptr;
  } catch (std::bad_alloc const &) {
    return nullptr;
  }
}

auto btregex_free(btregex_regex *regex) -> void { delete regex; }

auto btregex_test(btregex_regex const *regex, char const *text) -> bool {
  return btregex_test_with_config(regex, text, default_config);
}

auto btregex_test_with_config(btregex_regex const *regex, char const *text,
                              btregex_config config) -> bool {
  std::string_view const text_view{text};
  if (not is_valid_utf8(text_view)) {
    return false;
  }
  return regex->regex.test(text_view, to_config(config));
}

auto btregex_find_matches(btregex_regex const *regex, char const *text)
    -> btregex_matcher * {
  return btregex_find_matches_with_config(regex, text, default_config);
}

auto btregex_find_matches_with_config(btregex_regex const *regex,
                                      char const *text, btregex_config config)
    -> btregex_matcher * {
  std::string_view const text_view{text};
  if (not is_valid_utf8(text_view)) {
    return nullptr;
  }
  try {
    return new btregex_matcher{
        regex->regex.find_matches(text_view, to_config(config))};
  } catch (std::bad_alloc const &) {
    return nullptr;
  }
}

auto btregex_matcher_next(btregex_matcher *matcher, btregex_span *span)
    -> bool {
  auto match = matcher->matcher.next();
  if (not match.has_value()) {
    return false;
  }
  *span = btregex_span{
      .offset = match->byte_offset(),
      .len = match->byte_length(),
  };
  return true;
}

auto btregex_matcher_free(btregex_matcher *matcher) -> void { delete matcher; }
