#pragma once

#include <format>
#include <stdexcept>
#include <string_view>

namespace btregex {

template <typename... Ts> struct Overload : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

class RegexError : public std::runtime_error {
public:
  template <typename... T>
  explicit RegexError(std::string_view fmt_string, T &&...args)
      : std::runtime_error(
            std::vformat(fmt_string, std::make_format_args(args...))) {}
};

// Thrown by compile(), never by matching
class ParserError : public RegexError {
public:
  using RegexError::RegexError;
};
} // namespace btregex
