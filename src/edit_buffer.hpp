#pragma once
/*
 * EditBuffer
 *
 * Purpose: the state of an editing session: text, point, mark, filename,
 *          dirty flag and the display damage accumulated by the current
 *          command.
 * Contract: every mutator notes damage first, then adjusts the mark, then
 *           changes the text, then marks the buffer modified.
 */
#include <string>
#include <string_view>
#include <filesystem>
#include "types.hpp"
#include "text_buffer.hpp"
#include "i_display.hpp"

class EditBuffer;

// Snapshot of the state that undo and redo restore around a text change.
struct Memento {
  int point = 0;
  int mark = 0;
  void restore(EditBuffer& ed) const;
};

class EditBuffer {
public:
  EditBuffer() = default;
  EditBuffer(const EditBuffer&) = delete;
  EditBuffer& operator=(const EditBuffer&) = delete;

  void register_display(IDisplay* display) { display_ = display; }
  bool is_modified() const { return modified_; }

  /* display update */
  void force_rewrite() { note_damage(true); }
  // Flush: send the damage and the cursor position to the display, then
  // reset damage to Clean.
  void update() { update(point_); }
  void update(int pos);
  void init_display();
  Damage damage() const { return damage_; }
  int damage_line() const { return damage_line_; }

  /* accessors */
  int point() const { return point_; }
  // Moving point off the line held for RewriteLine damage escalates the
  // damage to Rewrite, since the display would otherwise only redraw the
  // cursor's new line.
  void set_point(int point);
  // Always within [0, length()]; a stale stored value reads as point.
  int mark() const;
  void set_mark(int mark) { mark_ = mark; }
  const std::string& filename() const { return filename_; }
  void set_filename(const std::string& name) { filename_ = name; }

  /* delegates to the text */
  char char_at(int pos) const { return text_.char_at(pos); }
  int get_row(int pos) const { return text_.get_row(pos); }
  int get_column(int pos) const { return text_.get_column(pos); }
  int get_pos(int row, int col) const { return text_.get_pos(row, col); }
  int length() const { return text_.length(); }
  int get_line_length(int row) const { return text_.get_line_length(row); }
  std::string get_range(int pos, int len) const { return text_.get_range(pos, len); }
  int num_lines() const { return text_.num_lines(); }
  std::string fetch_line(int row) const { return text_.fetch_line(row); }
  std::string text() const { return text_.text(); }
  std::string_view backend_name() const { return text_.backend_name(); }

  /* mutators */
  // Whether transpose(pos) would swap anything.
  bool can_transpose(int pos) const;
  void transpose(int pos);
  void set_char(int pos, char ch);
  void delete_char(int pos);
  void delete_range(int pos, int len);
  void insert(int pos, char ch);
  void insert(int pos, std::string_view s);

  bool load_file(const std::string& name);
  bool save_file(const std::string& name);

  Memento get_state() const { return Memento{point_, mark()}; }

private:
  void note_damage(bool rewrite);
  void set_modified() { modified_ = true; }
  void show_message(const std::string& msg);
  // Resolve the swap position transpose(pos) acts on, or -1.
  int transpose_target(int pos) const;

  TextBuffer text_;
  IDisplay* display_ = nullptr;
  int point_ = 0;
  int mark_ = 0;
  std::string filename_;
  bool modified_ = false;
  Damage damage_ = Damage::Clean;
  int damage_line_ = 0;
};
