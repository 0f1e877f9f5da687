#include "edit_buffer.hpp"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

// Records what the buffer sends to the display.
class RecordingDisplay : public IDisplay {
public:
  struct Refresh { Damage damage; int row; int col; };
  std::vector<Refresh> refreshes;
  std::string message;

  void show(const EditBuffer&) override {}
  int get_key() override { return 0; }
  void refresh(Damage damage, int row, int col) override { refreshes.push_back({damage, row, col}); }
  void scroll(int) override {}
  void choose_origin() override {}
  void set_message(const std::string& msg) override { message = msg; }
  void clear_message() override { message.clear(); }
  void beep() override {}
  bool ask(const std::string&) override { return true; }
  std::optional<std::string> read_string(const std::string&, const std::string& def) override { return def; }
  int text_height() const override { return 10; }
};

static void check_damage() {
  EditBuffer ed;
  RecordingDisplay disp;
  ed.register_display(&disp);
  ed.insert(0, std::string_view("ab\ncd"));
  ed.update();
  assert(ed.damage() == Damage::Clean);

  // same-line character insert: one line
  ed.set_point(1);
  ed.insert(1, 'x');
  assert(ed.damage() == Damage::RewriteLine);
  assert(ed.damage_line() == 0);
  ed.set_point(2);
  assert(ed.damage() == Damage::RewriteLine);
  ed.update();
  assert(disp.refreshes.back().damage == Damage::RewriteLine);
  assert(disp.refreshes.back().row == 0);
  assert(disp.refreshes.back().col == 2);
  assert(ed.damage() == Damage::Clean);

  // moving point to another row escalates
  ed.insert(2, 'y');
  ed.set_point(5);
  assert(ed.damage() == Damage::Rewrite);
  ed.update();

  // newline and multi-character spans rewrite everything
  ed.insert(0, '\n');
  assert(ed.damage() == Damage::Rewrite);
  ed.update();
  ed.delete_range(0, 2);
  assert(ed.damage() == Damage::Rewrite);
  ed.update();

  // an edit on a row other than point's row
  ed.set_point(0);
  ed.set_char(ed.length() - 1, 'Z');
  assert(ed.damage() == Damage::Rewrite);
  ed.update();

  // damage never goes down within one command
  ed.force_rewrite();
  ed.insert(0, 'q');
  assert(ed.damage() == Damage::Rewrite);
  ed.update();
  assert(ed.damage() == Damage::Clean);
}

static void check_mark_adjustment() {
  EditBuffer ed;
  ed.insert(0, std::string_view("0123456789"));
  ed.set_mark(5);

  ed.insert(5, 'a');            // at mark: pushed right
  assert(ed.mark() == 6);
  ed.insert(9, std::string_view("zz"));  // after mark: unchanged
  assert(ed.mark() == 6);
  ed.insert(0, std::string_view("xy"));  // before mark
  assert(ed.mark() == 8);

  ed.delete_char(0);            // before mark
  assert(ed.mark() == 7);
  ed.delete_char(7);            // at mark: unchanged
  assert(ed.mark() == 7);
  ed.delete_range(2, 3);        // entirely before mark
  assert(ed.mark() == 4);
  ed.delete_range(3, 4);        // straddles mark: clamped to the deletion point
  assert(ed.mark() == 3);
  ed.delete_range(3, 2);        // starts at mark: unchanged
  assert(ed.mark() == 3);

  // a stored mark beyond the text reads as point
  ed.set_point(1);
  ed.set_mark(1000);
  assert(ed.mark() == 1);
  ed.set_mark(-2);
  assert(ed.mark() == 1);
  assert(ed.mark() >= 0 && ed.mark() <= ed.length());
}

static void check_modified_and_state() {
  EditBuffer ed;
  assert(!ed.is_modified());
  ed.insert(0, 'a');
  assert(ed.is_modified());
  ed.set_point(1);
  ed.set_mark(0);
  Memento m = ed.get_state();
  assert(m.point == 1 && m.mark == 0);
  ed.insert(1, 'b');
  ed.set_point(2);
  m.restore(ed);
  assert(ed.point() == 1);
  assert(ed.mark() == 0);

  // both ends of the buffer are valid points in every build type
  ed.set_point(ed.length());
  assert(ed.point() == 2);
  ed.set_point(0);
  assert(ed.point() == 0);
}

static void check_transpose() {
  EditBuffer ed;
  ed.insert(0, std::string_view("hello\nworld\nab\n"));
  ed.set_point(5);
  assert(ed.can_transpose(5));
  ed.transpose(5);
  assert(ed.text() == "helol\nworld\nab\n");
  assert(ed.point() == 5);
  ed.transpose(5);
  assert(ed.text() == "hello\nworld\nab\n");

  // at line start: one to the right
  ed.transpose(6);
  assert(ed.text() == "hello\nowrld\nab\n");
  assert(ed.point() == 8);
  ed.transpose(6);

  // middle
  ed.transpose(8);
  assert(ed.text() == "hello\nwrold\nab\n");
  assert(ed.point() == 9);

  // "ab" is long enough at either end, "" is not
  assert(ed.can_transpose(12));
  assert(ed.can_transpose(14));
  assert(!ed.can_transpose(15));
  ed.transpose(14);
  assert(ed.text() == "hello\nwrold\nba\n");

  EditBuffer one;
  one.insert(0, 'x');
  assert(!one.can_transpose(0));
  assert(!one.can_transpose(1));
}

static void check_files() {
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
                              ("medit_eb_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  std::filesystem::path file = dir / "f.txt";
  {
    std::ofstream out(file, std::ios::binary);
    out << "line one\nline two\n";
  }

  EditBuffer ed;
  RecordingDisplay disp;
  ed.register_display(&disp);
  ed.insert(0, std::string_view("scratch"));
  ed.set_point(3);
  ed.set_mark(2);
  ed.update();

  // failed load: nothing changes except the message and the damage
  std::string missing = (dir / "missing.txt").string();
  assert(!ed.load_file(missing));
  assert(ed.text() == "scratch");
  assert(ed.point() == 3 && ed.mark() == 2);
  assert(ed.filename().empty());
  assert(ed.is_modified());
  assert(ed.damage() == Damage::Rewrite);
  assert(disp.message == "Couldn't read file '" + missing + "'");
  ed.update();

  assert(ed.load_file(file.string()));
  assert(ed.text() == "line one\nline two\n");
  assert(ed.point() == 0 && ed.mark() == 0);
  assert(ed.filename() == file.string());
  assert(!ed.is_modified());
  assert(ed.damage() == Damage::Rewrite);
  ed.update();

  ed.insert(0, std::string_view("# "));
  std::string copy = (dir / "copy.txt").string();
  assert(ed.save_file(copy));
  assert(ed.filename() == copy);
  assert(!ed.is_modified());
  assert(disp.message == "saved file: " + copy);

  ed.insert(0, 'x');
  std::string bad = (dir / "nope" / "x.txt").string();
  assert(!ed.save_file(bad));
  assert(ed.filename() == bad);
  assert(ed.is_modified());

  EditBuffer back;
  assert(back.load_file(copy));
  assert(back.text() == "# line one\nline two\n");
  std::filesystem::remove_all(dir);
}

int main() {
  check_damage();
  check_mark_adjustment();
  check_modified_and_state();
  check_transpose();
  check_files();
  std::printf("test_edit_buffer: ok\n");
  return 0;
}
