#include "edit_buffer.hpp"
#include <algorithm>
#include <glog/logging.h>

void Memento::restore(EditBuffer& ed) const {
  ed.set_point(point);
  ed.set_mark(mark);
}

void EditBuffer::note_damage(bool rewrite) {
  Damage level = rewrite ? Damage::Rewrite : Damage::RewriteLine;
  // the line is fixed by the first note: later edits may move its text
  if (damage_ == Damage::Clean) damage_line_ = text_.get_row(point_);
  damage_ = std::max(damage_, level);
}

void EditBuffer::update(int pos) {
  VLOG(2) << "flush " << damage_name(damage_) << " at " << pos;
  if (display_) display_->refresh(damage_, text_.get_row(pos), text_.get_column(pos));
  damage_ = Damage::Clean;
}

void EditBuffer::init_display() {
  note_damage(true);
  update();
}

void EditBuffer::set_point(int point) {
  CHECK(point >= 0 && point <= length()) << "point " << point << " outside [0, " << length() << "]";
  if (damage_ == Damage::RewriteLine && text_.get_row(point) != damage_line_)
    damage_ = Damage::Rewrite;
  point_ = point;
}

int EditBuffer::mark() const {
  if (0 <= mark_ && mark_ <= length()) return mark_;
  return point_;
}

void EditBuffer::show_message(const std::string& msg) {
  if (display_) display_->set_message(msg);
}

int EditBuffer::transpose_target(int pos) const {
  int row = get_row(pos);
  int start = get_pos(row, 0);
  int len = get_line_length(row);
  int end = start + len - 1;
  if (pos == start) return len > 2 ? transpose_target(pos + 1) : -1;
  if (pos == end) return len > 2 ? transpose_target(pos - 1) : -1;
  return pos;
}

bool EditBuffer::can_transpose(int pos) const { return transpose_target(pos) >= 0; }

void EditBuffer::transpose(int pos) {
  int target = transpose_target(pos);
  if (target < 0) return;
  note_damage(get_row(target) != get_row(point_));
  char ch = text_.char_at(target - 1);
  text_.set(target - 1, text_.char_at(target));
  text_.set(target, ch);
  set_point(target + 1);
  set_modified();
}

void EditBuffer::set_char(int pos, char ch) {
  note_damage(ch == '\n' || text_.char_at(pos) == '\n' || get_row(pos) != get_row(point_));
  text_.set(pos, ch);
  set_modified();
}

void EditBuffer::delete_char(int pos) {
  char ch = text_.char_at(pos);
  note_damage(ch == '\n' || get_row(pos) != get_row(point_));
  int m = mark();
  if (pos < m) mark_ = m - 1;
  text_.delete_char(pos);
  set_modified();
}

void EditBuffer::delete_range(int pos, int len) {
  if (len <= 0) return;
  if (len == 1) { delete_char(pos); return; }
  note_damage(true);
  // a range that covers the mark takes it to the deletion point
  int m = mark();
  if (pos + len <= m) mark_ = m - len;
  else if (pos < m) mark_ = pos;
  text_.delete_range(pos, len);
  set_modified();
}

void EditBuffer::insert(int pos, char ch) {
  note_damage(ch == '\n' || get_row(pos) != get_row(point_));
  int m = mark();
  if (pos <= m) mark_ = m + 1;
  text_.insert(pos, ch);
  set_modified();
}

void EditBuffer::insert(int pos, std::string_view s) {
  if (s.empty()) return;
  if (s.size() == 1) { insert(pos, s[0]); return; }
  note_damage(true);
  int m = mark();
  if (pos <= m) mark_ = m + static_cast<int>(s.size());
  text_.insert(pos, s);
  set_modified();
}

bool EditBuffer::load_file(const std::string& name) {
  std::string msg;
  note_damage(true);
  if (!text_.read_file(name, msg)) {
    LOG(WARNING) << "load failed: " << msg;
    show_message(msg);
    return false;
  }
  filename_ = name;
  point_ = 0;
  mark_ = 0;
  modified_ = false;
  LOG(INFO) << "loaded " << name << " (" << length() << " chars, " << num_lines() << " lines, "
            << backend_name() << " backend)";
  return true;
}

bool EditBuffer::save_file(const std::string& name) {
  filename_ = name;
  std::string msg;
  if (!text_.write_file(name, msg)) {
    LOG(WARNING) << "save failed: " << msg;
    show_message(msg);
    return false;
  }
  modified_ = false;
  LOG(INFO) << "saved " << name << " (" << length() << " chars)";
  show_message(msg);
  return true;
}
