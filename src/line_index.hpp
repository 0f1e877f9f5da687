#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

struct LineBlock {
  size_t base_offset;
  std::vector<size_t> rel;
};

// Start offsets of every line, stored in blocks so that an edit which
// keeps the line structure only rewrites one block and the block bases
// after it.
class LineIndex {
public:
  std::vector<LineBlock> blocks;
  size_t block_size = 1024;

  void build_from_text(const std::vector<char>& buf, size_t gap_start, size_t gap_end);
  void build_from_text(std::string_view text);
  size_t line_count() const;
  size_t line_start(size_t row) const;
  size_t row_of(size_t pos) const;
  // Move the start of every line after `row` by `delta`.
  void shift_after(size_t row, std::ptrdiff_t delta);

private:
  void build_from_starts(const std::vector<size_t>& starts);
};
