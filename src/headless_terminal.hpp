#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests: a character grid instead of a
 *          screen, and a scripted queue of keys instead of a keyboard.
 * Note: get_key throws std::runtime_error once the script is used up, so a
 *       test that forgets a key fails instead of hanging.
 */
#include <deque>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;
  int get_key() override;
  void beep() override { beeps_++; }

  void push_key(int key) { keys_.push_back(key); }
  void push_keys(std::initializer_list<int> keys);
  void push_text(std::string_view text);
  size_t pending_keys() const { return keys_.size(); }

  // Row contents with trailing blanks removed.
  std::string line(int row) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int beeps() const { return beeps_; }
  int refreshes() const { return refreshes_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::deque<int> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int beeps_ = 0;
  int refreshes_ = 0;
};
