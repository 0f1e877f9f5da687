#include "headless_terminal.hpp"
#include <algorithm>
#include <stdexcept>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols), grid_(rows, std::string(cols, ' ')) {}

void HeadlessTerminal::clear() {
  for (auto& row : grid_) row.assign(cols_, ' ');
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    grid_[row][c] = text[i];
  }
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int, int) {
  draw_text(row, col, text);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  for (int c = std::max(0, col); c < cols_; ++c) grid_[row][c] = ' ';
}

int HeadlessTerminal::get_key() {
  if (keys_.empty()) throw std::runtime_error("headless terminal: out of scripted keys");
  int key = keys_.front();
  keys_.pop_front();
  return key;
}

void HeadlessTerminal::push_keys(std::initializer_list<int> keys) {
  for (int k : keys) keys_.push_back(k);
}

void HeadlessTerminal::push_text(std::string_view text) {
  for (char c : text) keys_.push_back(static_cast<unsigned char>(c));
}

std::string HeadlessTerminal::line(int row) const {
  if (row < 0 || row >= rows_) return {};
  std::string s = grid_[row];
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}
