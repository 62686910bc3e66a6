#include "regex_test_common.hpp"
#include "testing.hpp"

#include <string_view>
#include <vector>

using namespace std::literals;

namespace {
constexpr btregex::MatchConfig ignore_case{.case_sensitive = false};
} // namespace

TEST_CASE(case_sensitive_by_default, "[regex][case]") {
  CHECK(!does_match("abc", "ABC"));
  CHECK(does_match("abc", "ABC", ignore_case));
  CHECK(does_match("ABC", "abc", ignore_case));
  CHECK(does_match("aBc", "AbC", ignore_case));
}

TEST_CASE(case_insensitive_classes, "[regex][case]") {
  CHECK(!does_match("^[a-z]+$", "HELLO"));
  CHECK(does_match("^[a-z]+$", "HELLO", ignore_case));
  CHECK(does_match("^[A-Z]$", "q", ignore_case));
  CHECK(does_match("^[xyz]$", "Y", ignore_case));
  CHECK(!does_match("^[^a-z]$", "Q", ignore_case));
}

TEST_CASE(case_insensitive_beyond_ascii, "[regex][case]") {
  CHECK(does_match("é", "É", ignore_case));
  CHECK(does_match("σ", "Σ", ignore_case));
  CHECK(does_match("д", "Д", ignore_case));
  CHECK(does_match("ÿ", "Ÿ", ignore_case));
  CHECK(does_match("i", "İ", ignore_case));
  CHECK(!does_match("é", "É"));
}

TEST_CASE(case_insensitive_backreference, "[regex][case]") {
  CHECK(!does_match(R"(^(ab)\1$)", "abAB"));
  CHECK(does_match(R"(^(ab)\1$)", "abAB", ignore_case));
}

TEST_CASE(case_insensitive_spans, "[regex][case]") {
  CHECK((all_spans("b", "ABAB", ignore_case) ==
         std::vector<Span>{{1, 2}, {3, 4}}));
  CHECK((all_slices("b", "ABAB", ignore_case) ==
         std::vector{"B"sv, "B"sv}));
  CHECK(all_spans("b", "ABAB").empty());
}
