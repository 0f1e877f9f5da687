#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, draw, cursor, keys, bell).
 * Goal: decouple Display from concrete impls (ncurses/headless), enable testing.
 */
#include <string>

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // Blocks until a key arrives; returns a character or an EditorKey.
  virtual int get_key() = 0;
  virtual void beep() = 0;
};
