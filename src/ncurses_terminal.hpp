#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  int get_key() override;
  void beep() override;
private:
  int translate(int ch) const;
  int key_ctrl_home_ = -1; // terminfo codes for ctrl-home/ctrl-end, if defined
  int key_ctrl_end_ = -1;
};
