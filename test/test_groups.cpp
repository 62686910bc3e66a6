#include "regex_test_common.hpp"
#include "testing.hpp"

#include <string_view>
#include <vector>

using namespace std::literals;

TEST_CASE(single_group, "[regex][groups]") {
  auto groups = first_groups(R"((.))", "a");
  REQUIRE(groups.size() == 1);
  CHECK(groups[0] == "a");
}

TEST_CASE(multi_group, "[regex][groups]") {
  auto groups = first_groups(R"((..)(.))", "abc");
  REQUIRE(groups.size() == 2);
  CHECK(groups[0] == "ab");
  CHECK(groups[1] == "c");
}

TEST_CASE(repeat_group, "[regex][groups]") {
  // Last iteration wins
  auto groups = first_groups(R"((..)+)", "abcdef");
  REQUIRE(groups.size() == 1);
  CHECK(groups[0] == "ef");

  groups = first_groups(R"(^(.)*$)", "xyz");
  REQUIRE(groups.size() == 1);
  CHECK(groups[0] == "z");
}

TEST_CASE(nested_groups, "[regex][groups]") {
  auto groups = first_groups(R"(((a)(b)))", "ab");
  REQUIRE(groups.size() == 3);
  CHECK(groups[0] == "ab");
  CHECK(groups[1] == "a");
  CHECK(groups[2] == "b");
}

TEST_CASE(group_stops_where_the_rest_matches, "[regex][groups]") {
  auto groups = first_groups(R"(^(a*)ab$)", "aaab");
  REQUIRE(groups.size() == 1);
  CHECK(groups[0] == "aa");

  groups = first_groups(R"(^(.*?)(b+)$)", "aabbb");
  REQUIRE(groups.size() == 2);
  CHECK(groups[0] == "aa");
  CHECK(groups[1] == "bbb");
}

TEST_CASE(unentered_group_is_empty, "[regex][groups]") {
  auto groups = first_groups(R"(a(x)?b)", "ab");
  REQUIRE(groups.size() == 1);
  CHECK(groups[0].empty());

  groups = first_groups(R"((a)|(b))", "b");
  REQUIRE(groups.size() == 2);
  CHECK(groups[0].empty());
  CHECK(groups[1] == "b");
}

TEST_CASE(groups_follow_the_latest_match, "[regex][groups]") {
  auto regex = btregex::compile(R"(([0-9]))");
  auto matcher = regex.find_matches("1a2");

  REQUIRE(matcher.next().has_value());
  CHECK(matcher.groups()[0] == "1");
  REQUIRE(matcher.next().has_value());
  CHECK(matcher.groups()[0] == "2");
  CHECK(not matcher.next().has_value());
  CHECK(matcher.groups()[0] == "2");
}

TEST_CASE(groups_span_survives_next, "[regex][groups]") {
  auto regex = btregex::compile(R"(([0-9]))");
  auto matcher = regex.find_matches("1a2");

  REQUIRE(matcher.next().has_value());
  auto const groups = matcher.groups();
  REQUIRE(groups.size() == 1);
  CHECK(groups[0] == "1");

  // Same storage, new contents
  REQUIRE(matcher.next().has_value());
  CHECK(groups[0] == "2");
  CHECK(groups.data() == matcher.groups().data());
}

TEST_CASE(backreference, "[regex][groups]") {
  CHECK(does_match(R"(^ab(.)c\1$)", "ab1c1"));
  CHECK(does_match(R"(^ab(.)c\1$)", "ab2c2"));
  CHECK(!does_match(R"(^ab(.)c\1$)", "ab1c2"));
  CHECK(!does_match(R"(^ab(.)c\1$)", "ab2c1"));
}

TEST_CASE(backreference_after_loop, "[regex][groups]") {
  auto const pattern = R"(^ab( [a-z]* )c\1$)"sv;
  CHECK(does_match(pattern, "ab abcd c abcd "));
  CHECK(does_match(pattern, "ab ahc c ahc "));

  CHECK(!does_match(pattern, "ab ahc c ahc"));
  CHECK(!does_match(pattern, "ab ahc cahc "));
  CHECK(!does_match(pattern, "ab ahc cahc"));
  CHECK(!does_match(pattern, "ab ahcc ahc"));
  CHECK(!does_match(pattern, "ab ag2a c ag2a "));
  CHECK(!does_match(pattern, "ab1c2"));
  CHECK(!does_match(pattern, "ab2c1"));
}

TEST_CASE(backreference_lazy, "[regex][groups]") {
  auto const pattern = R"(^1(.*?)2\1(.*?)3\k<2>4$)"sv;
  CHECK(does_match(pattern, "1abc2abcdef3def4"));
  CHECK(does_match(pattern, "1abc2abc34"));
  CHECK(!does_match(pattern, "1abc2abcd34"));

  auto groups = first_groups(pattern, "1abc2abcdef3def4");
  REQUIRE(groups.size() == 2);
  CHECK(groups[0] == "abc");
  CHECK(groups[1] == "def");
}

TEST_CASE(backreference_to_alternation, "[regex][groups]") {
  CHECK(does_match(R"(^(abc|def)123\1$)", "abc123abc"));
  CHECK(does_match(R"(^(abc|def)123\1$)", "def123def"));
  CHECK(!does_match(R"(^(abc|def)123\1$)", "abc123def"));
  CHECK(!does_match(R"(^(abc|def)123\1$)", "def123abc"));
}

TEST_CASE(backreference_syntax, "[regex][groups]") {
  CHECK(does_match(R"(^(a)(b)\k<2>\k<1>$)", "abba"));
  CHECK(does_match(R"(^(a)(b)\2\1$)", "abba"));
  CHECK(!does_match(R"(^(a)(b)\1\2$)", "abba"));

  // Multi-digit references
  CHECK(does_match(R"(^(a)(b)(c)(d)(e)(f)(g)(h)(i)(j)\10$)", "abcdefghijj"));
  CHECK(!does_match(R"(^(a)(b)(c)(d)(e)(f)(g)(h)(i)(j)\10$)", "abcdefghija0"));
}

TEST_CASE(backreference_to_multibyte_text, "[regex][groups]") {
  CHECK(does_match(R"(^(..)-\1$)", "éü-éü"));
  CHECK(!does_match(R"(^(..)-\1$)", "éü-üé"));
}
