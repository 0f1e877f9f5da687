#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <glog/logging.h>
#include "keymap.hpp"

static bool is_word_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

Editor::Editor(IDisplay& display, const Settings& settings)
    : display_(display),
      settings_(settings),
      history_(ed_, [this](const Action& action) { return obey(action); }) {}

void Editor::activate() {
  ed_.register_display(&display_);
  display_.show(ed_);
  ed_.init_display();
}

void Editor::load_file(const std::string& name) {
  if (!ed_.load_file(name)) ed_.set_filename(name);
  ed_.update();
}

void Editor::command_loop(const Keymap& keymap) {
  while (alive_) {
    int key = display_.get_key();
    VLOG(2) << "key " << key;
    perform(keymap.lookup(key));
  }
  LOG(INFO) << "command loop finished";
}

std::optional<Change> Editor::obey(const Action& action) {
  prev_goal_ = goal_;
  goal_ = -1;
  display_.clear_message();
  Memento before = ed_.get_state();
  std::optional<Change> change = action(*this);
  Memento after = ed_.get_state();
  ed_.update();
  if (!change) return std::nullopt;
  return Change::composite(before, std::move(*change), after);
}

bool Editor::perform(const Action& action) { return history_.perform(action); }

void Editor::undo() {
  if (!history_.undo()) display_.beep();
}

void Editor::redo() {
  if (!history_.redo()) display_.beep();
}

int Editor::goal_column() const {
  return prev_goal_ >= 0 ? prev_goal_ : ed_.get_column(ed_.point());
}

std::optional<Change> Editor::move_command(Direction dir) {
  int point = ed_.point();
  int row = ed_.get_row(point);
  int last_row = ed_.num_lines() - 1;
  switch (dir) {
    case Direction::Left:
      if (point == 0) { display_.beep(); break; }
      ed_.set_point(point - 1);
      break;
    case Direction::Right:
      if (point == ed_.length()) { display_.beep(); break; }
      ed_.set_point(point + 1);
      break;
    case Direction::Up:
    case Direction::Down: {
      int goal = goal_column();
      goal_ = goal;
      int target = dir == Direction::Up ? row - 1 : row + 1;
      if (target < 0 || target > last_row) { display_.beep(); break; }
      ed_.set_point(ed_.get_pos(target, goal));
      break;
    }
    case Direction::Home:
      ed_.set_point(ed_.get_pos(row, 0));
      break;
    case Direction::End:
      ed_.set_point(ed_.get_pos(row, ed_.get_line_length(row) - 1));
      break;
    case Direction::PageUp:
    case Direction::PageDown: {
      int amount = std::max(1, display_.text_height() - settings_.scroll_margin);
      if (dir == Direction::PageUp) amount = -amount;
      ed_.set_point(ed_.get_pos(std::clamp(row + amount, 0, last_row), 0));
      display_.scroll(amount);
      ed_.force_rewrite();
      break;
    }
    case Direction::CtrlHome:
      ed_.set_point(0);
      break;
    case Direction::CtrlEnd:
      ed_.set_point(ed_.length());
      break;
    default:
      LOG(FATAL) << "move_command: bad direction " << static_cast<int>(dir);
  }
  return std::nullopt;
}

std::optional<Change> Editor::delete_command(Direction dir) {
  int point = ed_.point();
  int pos = point;
  int len = 0;
  switch (dir) {
    case Direction::Left:
      if (point == 0) break;
      pos = point - 1;
      len = 1;
      break;
    case Direction::Right:
      if (point == ed_.length()) break;
      len = 1;
      break;
    case Direction::End: {
      if (point == ed_.length()) break;
      if (ed_.char_at(point) == '\n') { len = 1; break; }
      int row = ed_.get_row(point);
      len = ed_.get_pos(row, ed_.get_line_length(row) - 1) - point;
      break;
    }
    default:
      LOG(FATAL) << "delete_command: bad direction " << direction_name(dir);
  }
  if (len == 0) {
    display_.beep();
    return std::nullopt;
  }
  std::string text = ed_.get_range(pos, len);
  ed_.delete_range(pos, len);
  ed_.set_point(pos);
  if (dir == Direction::End) kill_ = text;
  return Change::deletion(pos, std::move(text));
}

std::optional<Change> Editor::insert_command(char ch) {
  int pos = ed_.point();
  ed_.insert(pos, ch);
  ed_.set_point(pos + 1);
  return Change::mergeable_insertion(pos, ch);
}

std::optional<Change> Editor::paste_command() {
  if (kill_.empty()) {
    display_.beep();
    return std::nullopt;
  }
  int pos = ed_.point();
  ed_.insert(pos, kill_);
  ed_.set_point(pos + static_cast<int>(kill_.size()));
  return Change::insertion(pos, kill_);
}

std::optional<Change> Editor::transpose_command() {
  int pos = ed_.point();
  if (!ed_.can_transpose(pos)) {
    display_.beep();
    return std::nullopt;
  }
  ed_.transpose(pos);
  return Change::transposition(pos);
}

std::optional<Change> Editor::to_upper_command() {
  int point = ed_.point();
  if (point == ed_.length() || !is_word_char(ed_.char_at(point))) {
    display_.beep();
    return std::nullopt;
  }
  int start = point;
  while (start > 0 && is_word_char(ed_.char_at(start - 1))) start--;
  int end = point;
  while (end < ed_.length() && is_word_char(ed_.char_at(end))) end++;
  std::string original = ed_.get_range(start, end - start);
  for (int i = start; i < end; ++i)
    ed_.set_char(i, static_cast<char>(std::toupper(static_cast<unsigned char>(ed_.char_at(i)))));
  ed_.set_point(end);
  return Change::uppercase(start, std::move(original));
}

std::optional<Change> Editor::mark_command() {
  ed_.set_mark(ed_.point());
  return std::nullopt;
}

std::optional<Change> Editor::switch_mark_command() {
  int mark = ed_.mark();
  ed_.set_mark(ed_.point());
  ed_.set_point(mark);
  return std::nullopt;
}

std::optional<Change> Editor::save_file_command() {
  std::optional<std::string> name = display_.read_string("Write file", ed_.filename());
  if (!name || name->empty()) return std::nullopt;
  ed_.save_file(*name);
  return std::nullopt;
}

std::optional<Change> Editor::replace_file_command() {
  if (!check_clean("Buffer modified -- really overwrite?")) return std::nullopt;
  std::optional<std::string> name = display_.read_string("Read file", ed_.filename());
  if (!name || name->empty()) return std::nullopt;
  if (ed_.load_file(*name)) {
    history_.reset();
    display_.choose_origin();
  }
  return std::nullopt;
}

std::optional<Change> Editor::choose_origin() {
  display_.choose_origin();
  ed_.force_rewrite();
  return std::nullopt;
}

std::optional<Change> Editor::quit() {
  if (check_clean("Buffer modified -- really quit?")) alive_ = false;
  return std::nullopt;
}

std::optional<Change> Editor::beep() {
  display_.beep();
  return std::nullopt;
}

bool Editor::check_clean(const std::string& question) {
  return !ed_.is_modified() || display_.ask(question);
}
