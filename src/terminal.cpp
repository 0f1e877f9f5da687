#include "terminal.hpp"
#include <locale.h>
#include <ncurses.h>
#include <stdexcept>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  if (!initscr()) throw std::runtime_error("cannot initialize the terminal");
  // raw: ctrl-C, ctrl-S, ctrl-Q and ctrl-Z arrive as keys
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  endwin();
}
