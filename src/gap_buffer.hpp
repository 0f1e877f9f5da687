#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Character array with a movable gap at the edit position, so runs of
// edits at one place cost O(1) each.
class GapBuffer {
public:
  std::vector<char> buf;
  size_t gap_start = 0;
  size_t gap_end = 0;

  void clear();
  size_t length() const;
  void init_from_text(std::string_view text);
  void move_gap_to(size_t pos);
  void ensure_gap(size_t need);
  char at(size_t pos) const;
  void set(size_t pos, char ch);
  void insert_text(size_t pos, std::string_view text);
  void erase_range(size_t pos, size_t len);
  std::string slice(size_t pos, size_t len) const;
};
