#include "ncurses_terminal.hpp"
#include <algorithm>
// clear(), refresh() and friends must stay functions: they share names with members
#define NCURSES_NOMACROS
#include <ncurses.h>
#include <glog/logging.h>
#include "keys.hpp"

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, -1, -1);
    else init_pair(1, COLOR_WHITE, COLOR_BLACK);
  }
  // xterm-style names for the modified Home/End keys
  int k = key_defined("kHOM5");
  if (k > 0) key_ctrl_home_ = k;
  k = key_defined("kEND5");
  if (k > 0) key_ctrl_end_ = k;
  VLOG(1) << "ncurses: ctrl-home=" << key_ctrl_home_ << " ctrl-end=" << key_ctrl_end_;
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { ::erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(1));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(1));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
    col += hl_start;
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
    col += hl_end - hl_start;
  }
  if (hl_end < len) mvaddnstr(row, col, text.c_str() + hl_end, len - hl_end);
}

void NcursesTerminal::move_cursor(int row, int col) { ::move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  ::move(row, col);
  clrtoeol();
}

int NcursesTerminal::translate(int ch) const {
  switch (ch) {
    case '\r': case KEY_ENTER: return EK_RETURN;
    case KEY_BACKSPACE: case 8: case 127: return EK_BACKSPACE;
    case KEY_LEFT: return EK_LEFT;
    case KEY_RIGHT: return EK_RIGHT;
    case KEY_UP: return EK_UP;
    case KEY_DOWN: return EK_DOWN;
    case KEY_HOME: return EK_HOME;
    case KEY_END: return EK_END;
    case KEY_PPAGE: return EK_PAGEUP;
    case KEY_NPAGE: return EK_PAGEDOWN;
    case KEY_DC: return EK_DEL;
    case KEY_RESIZE: return EK_RESIZE;
    default: break;
  }
  if (ch == key_ctrl_home_) return EK_CTRLHOME;
  if (ch == key_ctrl_end_) return EK_CTRLEND;
  if (ch >= KEY_MIN) return EK_UNKNOWN;
  return ch;
}

int NcursesTerminal::get_key() {
  int ch;
  while ((ch = getch()) == ERR) {}
  return translate(ch);
}

void NcursesTerminal::beep() { ::beep(); }
