#include "gap_buffer.hpp"
#include <algorithm>

static constexpr size_t kMinGap = 64;

void GapBuffer::clear() { buf.clear(); gap_start = gap_end = 0; }

size_t GapBuffer::length() const { return buf.size() - (gap_end - gap_start); }

void GapBuffer::init_from_text(std::string_view text) {
  buf.assign(text.begin(), text.end());
  buf.resize(text.size() + kMinGap);
  gap_start = text.size();
  gap_end = buf.size();
}

void GapBuffer::ensure_gap(size_t need) {
  size_t avail = gap_end - gap_start;
  if (avail >= need) return;
  size_t grow = std::max(need - avail, std::max(kMinGap, buf.size() / 2));
  std::vector<char> nb(buf.size() + grow);
  std::copy(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(gap_start), nb.begin());
  size_t right = buf.size() - gap_end;
  size_t nge = nb.size() - right;
  std::copy(buf.begin() + static_cast<std::ptrdiff_t>(gap_end), buf.end(),
            nb.begin() + static_cast<std::ptrdiff_t>(nge));
  buf.swap(nb);
  gap_end = nge;
}

void GapBuffer::move_gap_to(size_t pos) {
  if (pos == gap_start) return;
  if (pos < gap_start) {
    size_t delta = gap_start - pos;
    for (size_t i = 0; i < delta; ++i) buf[gap_end - 1 - i] = buf[gap_start - 1 - i];
    gap_start -= delta; gap_end -= delta;
  } else {
    size_t delta = pos - gap_start;
    for (size_t i = 0; i < delta; ++i) buf[gap_start + i] = buf[gap_end + i];
    gap_start += delta; gap_end += delta;
  }
}

char GapBuffer::at(size_t pos) const {
  return pos < gap_start ? buf[pos] : buf[pos + (gap_end - gap_start)];
}

void GapBuffer::set(size_t pos, char ch) {
  if (pos < gap_start) buf[pos] = ch; else buf[pos + (gap_end - gap_start)] = ch;
}

void GapBuffer::insert_text(size_t pos, std::string_view text) {
  move_gap_to(pos);
  ensure_gap(text.size());
  std::copy(text.begin(), text.end(), buf.begin() + static_cast<std::ptrdiff_t>(gap_start));
  gap_start += text.size();
}

void GapBuffer::erase_range(size_t pos, size_t len) {
  move_gap_to(pos);
  gap_end += len;
}

std::string GapBuffer::slice(size_t pos, size_t len) const {
  std::string out; out.resize(len);
  for (size_t i = 0; i < len; ++i) out[i] = at(pos + i);
  return out;
}
