#include "display.hpp"
#include <algorithm>
#include <sstream>
#include "edit_buffer.hpp"
#include "keys.hpp"

Display::Display(ITerminal& term, const Settings& settings)
    : term_(term), settings_(settings) {}

void Display::show(const EditBuffer& buf) {
  buf_ = &buf;
  origin_ = 0;
  left_col_ = 0;
  rewrite_pending_ = true;
}

int Display::get_key() { return term_.get_key(); }

int Display::text_height() const {
  return std::max(1, term_.get_size().rows - 1);
}

void Display::refresh(Damage damage, int row, int col) {
  if (!buf_) return;
  TermSize sz = term_.get_size();
  int rows = text_height();
  bool rewrite = damage == Damage::Rewrite || rewrite_pending_;

  int gutter = Renderer::gutter_width(buf_->num_lines(), settings_.line_numbers);
  if (gutter != gutter_) { gutter_ = gutter; rewrite = true; }

  if (recenter_ || row < origin_ || row >= origin_ + rows) {
    origin_ = std::max(0, row - rows / 2);
    recenter_ = false;
    rewrite = true;
  }

  int scol = Renderer::screen_column(buf_->fetch_line(row), col, settings_.tab_width);
  int text_cols = std::max(1, sz.cols - gutter_);
  if (scol < left_col_) {
    left_col_ = scol;
    rewrite = true;
  } else if (scol >= left_col_ + text_cols) {
    left_col_ = scol - text_cols + 1;
    rewrite = true;
  }

  RenderView view;
  view.origin = origin_;
  view.left_col = left_col_;
  view.text_rows = rows;
  view.cols = sz.cols;
  view.gutter = gutter_;
  view.tab_width = settings_.tab_width;

  if (rewrite) {
    term_.clear();
    renderer_.draw_rows(term_, *buf_, view);
  } else if (damage == Damage::RewriteLine) {
    renderer_.draw_row(term_, *buf_, view, row - origin_);
  }
  renderer_.draw_status(term_, sz.rows - 1, sz.cols - 1, status_text(row, col));
  term_.move_cursor(row - origin_, gutter_ + scol - left_col_);
  term_.refresh();
  rewrite_pending_ = false;
}

void Display::scroll(int amount) {
  int last = buf_ ? std::max(0, buf_->num_lines() - 1) : 0;
  origin_ = std::clamp(origin_ + amount, 0, last);
  rewrite_pending_ = true;
}

void Display::choose_origin() {
  recenter_ = true;
  rewrite_pending_ = true;
}

void Display::set_message(const std::string& msg) { message_ = msg; }

void Display::clear_message() { message_.clear(); }

void Display::beep() { term_.beep(); }

std::string Display::status_text(int row, int col) const {
  if (!message_.empty()) return message_;
  std::ostringstream oss;
  oss << (buf_->filename().empty() ? std::string("[no file]") : buf_->filename())
      << (buf_->is_modified() ? " [+]" : "")
      << "  row:" << (row + 1) << " col:" << (col + 1);
  return oss.str();
}

void Display::prompt_line(const std::string& text) {
  TermSize sz = term_.get_size();
  renderer_.draw_status(term_, sz.rows - 1, sz.cols - 1, text);
  term_.move_cursor(sz.rows - 1, std::min(static_cast<int>(text.size()), std::max(0, sz.cols - 1)));
  term_.refresh();
}

bool Display::ask(const std::string& question) {
  std::string text = question + " (y/n) ";
  for (;;) {
    prompt_line(text);
    int key = term_.get_key();
    if (key == 'y' || key == 'Y') return true;
    if (key == 'n' || key == 'N' || key == ctrl('G')) return false;
    term_.beep();
  }
}

std::optional<std::string> Display::read_string(const std::string& prompt, const std::string& def) {
  std::string value = def;
  for (;;) {
    prompt_line(prompt + ": " + value);
    int key = term_.get_key();
    if (key == EK_RETURN) return value;
    if (key == ctrl('G')) return std::nullopt;
    if (key == EK_BACKSPACE) {
      if (value.empty()) term_.beep(); else value.pop_back();
    } else if (is_printable_key(key)) {
      value.push_back(static_cast<char>(key));
    } else {
      term_.beep();
    }
  }
}
