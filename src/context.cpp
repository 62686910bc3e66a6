#include "btregex/context.hpp"

#include <cassert>

using namespace btregex;

MatchContext::MatchContext(std::string_view text, size_t n_captures,
                           MatchConfig config)
    : m_cursor{text},
      m_captures{std::make_shared<std::vector<std::string_view>>(n_captures)},
      m_open_captures{std::make_shared<std::vector<OpenCapture>>()},
      m_config{config} {}

auto MatchContext::captures_for_write() -> std::vector<std::string_view> & {
  if (m_captures.use_count() > 1) {
    m_captures = std::make_shared<std::vector<std::string_view>>(*m_captures);
  }
  return *m_captures;
}

auto MatchContext::open_captures_for_write() -> std::vector<OpenCapture> & {
  if (m_open_captures.use_count() > 1) {
    m_open_captures =
        std::make_shared<std::vector<OpenCapture>>(*m_open_captures);
  }
  return *m_open_captures;
}

auto MatchContext::capture(size_t capture_id) const -> std::string_view {
  // The compiler never emits a reference to a group that doesn't exist
  assert(capture_id >= 1 && capture_id <= m_captures->size());
  return (*m_captures)[capture_id - 1];
}

auto MatchContext::push_capture(size_t capture_id) -> void {
  open_captures_for_write().push_back({capture_id, m_cursor});
}

auto MatchContext::pop_capture() -> void {
  assert(not m_open_captures->empty());
  open_captures_for_write().pop_back();
}

auto MatchContext::update_open_captures() -> void {
  if (m_open_captures->empty()) {
    return;
  }

  // Only detach the shared capture array when something actually changes
  bool is_up_to_date = true;
  for (auto const &open : *m_open_captures) {
    auto slice = open.start.slice_to(m_cursor);
    auto const &current = (*m_captures)[open.capture_id - 1];
    if (current.data() != slice.data() || current.size() != slice.size()) {
      is_up_to_date = false;
      break;
    }
  }
  if (is_up_to_date) {
    return;
  }

  auto &captures = captures_for_write();
  for (auto const &open : *m_open_captures) {
    captures[open.capture_id - 1] = open.start.slice_to(m_cursor);
  }
}
