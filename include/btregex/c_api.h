#pragma once

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct btregex_regex btregex_regex;
typedef struct btregex_matcher btregex_matcher;

typedef struct btregex_config {
  bool case_sensitive;
} btregex_config;

// Offset and length in UTF-8 bytes
typedef struct btregex_span {
  size_t offset;
  size_t len;
} btregex_span;

// Returns NULL if the pattern is not valid UTF-8 or fails to compile
btregex_regex *btregex_compile(char const *pattern);
void btregex_free(btregex_regex *regex);

// False for input that is not valid UTF-8
bool btregex_test(btregex_regex const *regex, char const *text);
bool btregex_test_with_config(btregex_regex const *regex, char const *text,
                              btregex_config config);

// The matcher borrows both `regex` and `text`, they must outlive it.
// Returns NULL for input that is not valid UTF-8.
btregex_matcher *btregex_find_matches(btregex_regex const *regex,
                                      char const *text);
btregex_matcher *btregex_find_matches_with_config(btregex_regex const *regex,
                                                  char const *text,
                                                  btregex_config config);

// Fills `span` and returns true, or returns false once exhausted
bool btregex_matcher_next(btregex_matcher *matcher, btregex_span *span);
void btregex_matcher_free(btregex_matcher *matcher);

#ifdef __cplusplus
}
#endif
