#pragma once
/*
 * Renderer
 *
 * Purpose: draw buffer rows and the status line through ITerminal.
 * Constraint: stateless; Display owns the viewport and decides what to redraw.
 */
#include <string>
#include "iterminal.hpp"

class EditBuffer;

struct RenderView {
  int origin = 0;     // buffer row on screen row 0
  int left_col = 0;   // first screen column of text shown
  int text_rows = 0;
  int cols = 0;
  int gutter = 0;     // line-number width plus one space, or 0
  int tab_width = 8;
};

class Renderer {
public:
  static std::string expand_tabs(const std::string& line, int tab_width);
  // Screen column of character `col` of `line` once tabs are expanded.
  static int screen_column(const std::string& line, int col, int tab_width);
  static int gutter_width(int num_lines, bool line_numbers);

  void draw_row(ITerminal& term, const EditBuffer& buf, const RenderView& view, int screen_row) const;
  void draw_rows(ITerminal& term, const EditBuffer& buf, const RenderView& view) const;
  void draw_status(ITerminal& term, int row, int cols, const std::string& text) const;
};
