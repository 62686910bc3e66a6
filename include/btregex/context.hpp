#pragma once

#include "unicode.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace btregex {

struct MatchConfig {
  bool case_sensitive = true;
};

// Forward-only position in a UTF-8 string. Copies are independent and cheap.
class TextCursor {
  std::string_view m_text;
  size_t m_byte_offset;
  size_t m_char_offset;

public:
  constexpr explicit TextCursor(std::string_view text)
      : m_text{text}, m_byte_offset{0}, m_char_offset{0} {}

  constexpr auto is_at_end() const -> bool {
    return m_byte_offset >= m_text.size();
  }

  constexpr auto peek() const -> std::optional<Codepoint> {
    if (is_at_end()) {
      return std::nullopt;
    }
    size_t size = 0;
    return parse_utf8_char(m_text.substr(m_byte_offset), size);
  }

  constexpr auto next() -> std::optional<Codepoint> {
    if (is_at_end()) {
      return std::nullopt;
    }
    size_t size = 0;
    auto codepoint = parse_utf8_char(m_text.substr(m_byte_offset), size);
    m_byte_offset += size;
    m_char_offset += 1;
    return codepoint;
  }

  constexpr auto byte_offset() const -> size_t { return m_byte_offset; }
  constexpr auto char_offset() const -> size_t { return m_char_offset; }
  constexpr auto text() const -> std::string_view { return m_text; }

  // Text between this cursor and a cursor that has advanced further
  constexpr auto slice_to(TextCursor const &end) const -> std::string_view {
    return m_text.substr(m_byte_offset, end.m_byte_offset - m_byte_offset);
  }
};

// Backtracking state for one match attempt. Duplicating a context is the
// only way to make a trial: the duplicate shares the capture storage until
// one side writes to it, at which point the writer takes a private copy.
class MatchContext {
  struct OpenCapture {
    size_t capture_id;
    TextCursor start;
  };

  TextCursor m_cursor;
  std::shared_ptr<std::vector<std::string_view>> m_captures;
  std::shared_ptr<std::vector<OpenCapture>> m_open_captures;
  MatchConfig m_config;

  auto captures_for_write() -> std::vector<std::string_view> &;
  auto open_captures_for_write() -> std::vector<OpenCapture> &;

public:
  MatchContext(std::string_view text, size_t n_captures, MatchConfig config);

  auto cursor() const -> TextCursor const & { return m_cursor; }
  auto config() const -> MatchConfig const & { return m_config; }

  auto is_at_end() const -> bool { return m_cursor.is_at_end(); }
  auto char_offset() const -> size_t { return m_cursor.char_offset(); }
  auto peek_char() const -> std::optional<Codepoint> { return m_cursor.peek(); }
  auto next_char() -> std::optional<Codepoint> { return m_cursor.next(); }

  // Folded according to the configured case sensitivity
  auto fold(Codepoint codepoint) const -> Codepoint {
    return fold_case(codepoint, m_config.case_sensitive);
  }

  auto capture(size_t capture_id) const -> std::string_view;
  auto captures() const -> std::span<std::string_view const> {
    return *m_captures;
  }
  auto open_capture_count() const -> size_t { return m_open_captures->size(); }

  auto push_capture(size_t capture_id) -> void;
  auto pop_capture() -> void;

  // Every open group's capture is set to span from where the group was
  // entered up to the current cursor
  auto update_open_captures() -> void;
};
} // namespace btregex
