#include "gap_text_buffer_core.hpp"

static inline void rebuild(GapTextBufferCore& c) {
  c.li.build_from_text(c.gb.buf, c.gb.gap_start, c.gb.gap_end);
}

GapTextBufferCore::GapTextBufferCore() { rebuild(*this); }

void GapTextBufferCore::init_from_text(std::string_view text) {
  gb.clear();
  gb.init_from_text(text);
  rebuild(*this);
}

void GapTextBufferCore::insert(size_t pos, std::string_view s) {
  if (s.empty()) return;
  size_t row = li.row_of(pos);
  gb.insert_text(pos, s);
  if (s.find('\n') != std::string_view::npos) rebuild(*this);
  else li.shift_after(row, static_cast<std::ptrdiff_t>(s.size()));
}

void GapTextBufferCore::erase(size_t pos, size_t len) {
  if (len == 0) return;
  bool joins = false;
  for (size_t i = 0; i < len && !joins; ++i) joins = gb.at(pos + i) == '\n';
  size_t row = li.row_of(pos);
  gb.erase_range(pos, len);
  if (joins) rebuild(*this);
  else li.shift_after(row, -static_cast<std::ptrdiff_t>(len));
}

void GapTextBufferCore::set_char(size_t pos, char ch) {
  char old = gb.at(pos);
  gb.set(pos, ch);
  if (old == '\n' || ch == '\n') rebuild(*this);
}
