#include "line_index.hpp"
#include <algorithm>

static inline char at_logical(const std::vector<char>& buf, size_t gap_start, size_t gap_end, size_t i) {
  if (i < gap_start) return buf[i];
  return buf[i + (gap_end - gap_start)];
}

void LineIndex::build_from_text(const std::vector<char>& buf, size_t gap_start, size_t gap_end) {
  size_t len = buf.size() - (gap_end - gap_start);
  std::vector<size_t> starts;
  starts.push_back(0);
  for (size_t i = 0; i < len; ++i) {
    if (at_logical(buf, gap_start, gap_end, i) == '\n') starts.push_back(i + 1);
  }
  build_from_starts(starts);
}

void LineIndex::build_from_text(std::string_view text) {
  std::vector<size_t> starts;
  starts.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') starts.push_back(i + 1);
  }
  build_from_starts(starts);
}

void LineIndex::build_from_starts(const std::vector<size_t>& starts) {
  blocks.clear();
  size_t n = starts.size();
  for (size_t i = 0; i < n; i += block_size) {
    size_t end = std::min(n, i + block_size);
    LineBlock b;
    b.base_offset = starts[i];
    b.rel.reserve(end - i);
    for (size_t k = i; k < end; ++k) b.rel.push_back(starts[k] - b.base_offset);
    blocks.push_back(std::move(b));
  }
}

size_t LineIndex::line_count() const { size_t c = 0; for (const auto& b : blocks) c += b.rel.size(); return c; }

size_t LineIndex::line_start(size_t row) const {
  if (blocks.empty()) return 0;
  size_t acc = 0;
  for (const auto& b : blocks) {
    if (row < acc + b.rel.size()) {
      size_t idx = row - acc;
      return b.base_offset + b.rel[idx];
    }
    acc += b.rel.size();
  }
  return blocks.back().base_offset + blocks.back().rel.back();
}

size_t LineIndex::row_of(size_t pos) const {
  if (blocks.empty()) return 0;
  auto bit = std::upper_bound(blocks.begin(), blocks.end(), pos,
                              [](size_t p, const LineBlock& b) { return p < b.base_offset; });
  if (bit != blocks.begin()) --bit;
  size_t acc = 0;
  for (auto it = blocks.begin(); it != bit; ++it) acc += it->rel.size();
  auto rit = std::upper_bound(bit->rel.begin(), bit->rel.end(), pos - bit->base_offset);
  return acc + static_cast<size_t>(rit - bit->rel.begin()) - 1;
}

void LineIndex::shift_after(size_t row, std::ptrdiff_t delta) {
  if (delta == 0) return;
  size_t acc = 0;
  for (auto& b : blocks) {
    size_t n = b.rel.size();
    if (row + 1 <= acc) {
      b.base_offset = static_cast<size_t>(static_cast<std::ptrdiff_t>(b.base_offset) + delta);
    } else if (row + 1 < acc + n) {
      for (size_t k = row + 1 - acc; k < n; ++k) {
        b.rel[k] = static_cast<size_t>(static_cast<std::ptrdiff_t>(b.rel[k]) + delta);
      }
    }
    acc += n;
  }
}
