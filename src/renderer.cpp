#include "renderer.hpp"
#include <algorithm>
#include "edit_buffer.hpp"

std::string Renderer::expand_tabs(const std::string& line, int tab_width) {
  if (line.find('\t') == std::string::npos) return line;
  std::string out;
  out.reserve(line.size() + 8);
  for (char c : line) {
    if (c == '\t') {
      size_t pad = static_cast<size_t>(tab_width) - out.size() % static_cast<size_t>(tab_width);
      out.append(pad, ' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

int Renderer::screen_column(const std::string& line, int col, int tab_width) {
  int sc = 0;
  int n = std::min(col, static_cast<int>(line.size()));
  for (int i = 0; i < n; ++i) {
    if (line[i] == '\t') sc += tab_width - sc % tab_width;
    else sc++;
  }
  return sc + std::max(0, col - n);
}

int Renderer::gutter_width(int num_lines, bool line_numbers) {
  if (!line_numbers) return 0;
  int digits = 1;
  int total = std::max(1, num_lines);
  while (total >= 10) { total /= 10; digits++; }
  return digits + 1;
}

void Renderer::draw_row(ITerminal& term, const EditBuffer& buf, const RenderView& view, int screen_row) const {
  if (screen_row < 0 || screen_row >= view.text_rows) return;
  int line_idx = view.origin + screen_row;
  if (line_idx >= buf.num_lines()) {
    term.clear_to_eol(screen_row, 0);
    return;
  }
  if (view.gutter > 0) {
    std::string num = std::to_string(line_idx + 1);
    std::string pad(std::max(0, view.gutter - 1 - static_cast<int>(num.size())), ' ');
    term.draw_text(screen_row, 0, pad + num + " ");
  }
  std::string s = expand_tabs(buf.fetch_line(line_idx), view.tab_width);
  int s_len = static_cast<int>(s.size());
  int text_cols = std::max(0, view.cols - view.gutter);
  int start_col = std::min(std::max(0, view.left_col), s_len);
  int end_col = std::min(s_len, start_col + text_cols);
  std::string vis = s.substr(start_col, end_col - start_col);
  term.draw_text(screen_row, view.gutter, vis);
  term.clear_to_eol(screen_row, view.gutter + static_cast<int>(vis.size()));
}

void Renderer::draw_rows(ITerminal& term, const EditBuffer& buf, const RenderView& view) const {
  for (int i = 0; i < view.text_rows; ++i) draw_row(term, buf, view, i);
}

void Renderer::draw_status(ITerminal& term, int row, int cols, const std::string& text) const {
  int width = std::max(0, cols);
  std::string shown = text.substr(0, static_cast<size_t>(width));
  shown.resize(static_cast<size_t>(width), ' ');
  term.draw_highlighted(row, 0, shown, 0, width);
  term.clear_to_eol(row, width);
}
