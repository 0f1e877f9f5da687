#include "editor.hpp"
#include "display.hpp"
#include "headless_terminal.hpp"
#include "keymap.hpp"
#include "keys.hpp"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <unistd.h>

// An editor on a 10x60 headless screen with the default keymap.
struct Session {
  HeadlessTerminal term{10, 60};
  Settings settings;
  Display display{term, settings};
  Editor editor{display, settings};
  Keymap keymap = default_keymap();

  explicit Session(std::string_view text = {}) {
    editor.activate();
    if (!text.empty()) {
      editor.buffer().insert(0, text);
      editor.buffer().update();
    }
  }
  void keys(std::initializer_list<int> ks) {
    for (int k : ks) editor.perform(keymap.lookup(k));
  }
  void type(std::string_view s) {
    for (char c : s) editor.perform(keymap.lookup(static_cast<unsigned char>(c)));
  }
  EditBuffer& ed() { return editor.buffer(); }
  std::string text() { return editor.buffer().text(); }
  int point() { return editor.buffer().point(); }
};

static std::filesystem::path scratch_dir() {
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
                              ("medit_ed_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  return dir;
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void check_typing_and_undo() {
  Session s;
  s.type("abc");
  assert(s.text() == "abc");
  assert(s.editor.history().size() == 1);
  s.keys({ctrl('Z')});
  assert(s.text().empty());
  assert(s.point() == 0);
  s.keys({ctrl('Y')});
  assert(s.text() == "abc");
  assert(s.point() == 3);
  // nothing left to redo
  int beeps = s.term.beeps();
  s.keys({ctrl('Y')});
  assert(s.term.beeps() == beeps + 1);

  Session t;
  t.type("ab\ncd");
  assert(t.editor.history().size() == 2);
  t.keys({ctrl('Z'), ctrl('Z')});
  assert(t.text().empty());
  assert(t.point() == 0 && t.ed().mark() == 0);
  t.keys({ctrl('Z')});
  assert(t.term.beeps() == 1);
  assert(t.editor.history().cursor() == 0);
}

static void check_motion() {
  Session s("abcdef\nab\nabcdef");
  s.ed().set_point(5);
  s.keys({EK_DOWN});
  assert(s.point() == 9);
  s.keys({EK_DOWN});
  assert(s.point() == 15);
  s.keys({ctrl('P'), EK_UP});
  assert(s.point() == 5);
  s.keys({EK_UP});
  assert(s.point() == 5);
  assert(s.term.beeps() == 1);

  // any other command forgets the goal column
  s.keys({EK_LEFT, ctrl('N')});
  assert(s.point() == 9);
  s.keys({ctrl('N')});
  assert(s.point() == 14);
  s.keys({EK_DOWN});
  assert(s.term.beeps() == 2);

  s.keys({ctrl('A')});
  assert(s.point() == 10);
  s.keys({ctrl('E')});
  assert(s.point() == 16);
  s.keys({EK_RIGHT});
  assert(s.term.beeps() == 3);
  s.keys({EK_CTRLHOME, ctrl('B')});
  assert(s.point() == 0);
  assert(s.term.beeps() == 4);
  s.keys({EK_END});
  assert(s.point() == 6);
  s.keys({EK_HOME, ctrl('F')});
  assert(s.point() == 1);
  s.keys({EK_CTRLEND});
  assert(s.point() == s.ed().length());
  // motion is never recorded
  assert(s.editor.history().size() == 0);
}

static void check_paging() {
  std::string text;
  for (int i = 0; i < 30; ++i) text += "line " + std::to_string(i) + "\n";
  Session s(text);
  // 9 text rows minus the default margin of 3
  s.ed().set_point(2);
  s.keys({EK_PAGEDOWN});
  assert(s.ed().get_row(s.point()) == 6);
  assert(s.ed().get_column(s.point()) == 0);
  assert(s.display.origin() == 6);
  s.keys({EK_PAGEDOWN, EK_PAGEDOWN, EK_PAGEDOWN, EK_PAGEDOWN, EK_PAGEDOWN});
  assert(s.ed().get_row(s.point()) == 30);
  s.keys({EK_PAGEUP});
  assert(s.ed().get_row(s.point()) == 24);
  s.keys({EK_CTRLHOME, EK_PAGEUP});
  assert(s.point() == 0);
  assert(s.display.origin() == 0);
}

static void check_deletion_and_paste() {
  Session s("one two\nthree");
  s.keys({EK_BACKSPACE});
  assert(s.term.beeps() == 1);
  s.keys({EK_DEL});
  assert(s.text() == "ne two\nthree");
  s.keys({ctrl('Z')});
  assert(s.text() == "one two\nthree");

  s.ed().set_point(4);
  s.keys({ctrl('K')});
  assert(s.text() == "one \nthree");
  assert(s.editor.kill_text() == "two");
  assert(s.point() == 4);
  s.keys({EK_CTRLEND, ctrl('V')});
  assert(s.text() == "one \nthreetwo");
  assert(s.point() == s.ed().length());
  s.keys({ctrl('K'), ctrl('D')});
  assert(s.term.beeps() == 3);

  s.keys({ctrl('Z'), ctrl('Z')});
  assert(s.text() == "one two\nthree");
  assert(s.point() == 4);

  // on a newline, kill joins the lines
  s.keys({ctrl('E'), ctrl('K')});
  assert(s.text() == "one twothree");
  assert(s.editor.kill_text() == "\n");
  s.keys({EK_BACKSPACE});
  assert(s.text() == "one twthree");

  Session empty;
  empty.keys({ctrl('V')});
  assert(empty.term.beeps() == 1);
  assert(empty.editor.history().size() == 0);
}

static void check_transpose_and_upcase() {
  Session s("hello\nworld");
  s.ed().set_point(5);
  s.keys({ctrl('T')});
  assert(s.text() == "helol\nworld");
  s.keys({ctrl('T')});
  assert(s.text() == "hello\nworld");
  assert(s.editor.history().size() == 2);
  s.keys({ctrl('Z')});
  assert(s.text() == "helol\nworld");
  assert(s.point() == 5);

  Session one("a");
  one.keys({ctrl('T')});
  assert(one.text() == "a");
  assert(one.term.beeps() == 1);

  Session u("foo bar, baz");
  u.ed().set_point(5);
  u.keys({ctrl('U')});
  assert(u.text() == "foo BAR, baz");
  assert(u.point() == 7);
  u.keys({ctrl('U')});
  assert(u.term.beeps() == 1);
  u.keys({ctrl('Z')});
  assert(u.text() == "foo bar, baz");
  assert(u.point() == 5);
}

static void check_mark() {
  Session s("abcdef");
  s.ed().set_point(2);
  s.keys({0, ctrl('F'), ctrl('F'), ctrl('F')});
  assert(s.ed().mark() == 2);
  s.keys({ctrl('O')});
  assert(s.point() == 2);
  assert(s.ed().mark() == 5);
  s.keys({ctrl('O')});
  assert(s.point() == 5 && s.ed().mark() == 2);
}

static void check_unbound_and_misc() {
  Session s("x");
  s.type("y");
  assert(s.editor.history().amalgamating());
  s.keys({ctrl('C')});
  assert(s.term.beeps() == 1);
  assert(!s.editor.history().amalgamating());
  assert(s.editor.history().size() == 1);

  s.keys({ctrl('G'), ctrl('L'), EK_RESIZE});
  assert(s.term.beeps() == 2);
  assert(s.text() == "yx");
}

static void check_files_and_quit() {
  std::filesystem::path dir = scratch_dir();
  std::string missing = (dir / "new.txt").string();

  Session s;
  s.editor.load_file(missing);
  assert(s.ed().filename() == missing);
  assert(s.display.message() == "Couldn't read file '" + missing + "'");
  assert(s.text().empty());

  s.type("hello\n");
  assert(s.ed().is_modified());
  s.term.push_key(EK_RETURN);
  s.keys({ctrl('W')});
  assert(!s.ed().is_modified());
  assert(slurp(missing) == "hello\n");
  assert(s.display.message() == "saved file: " + missing);

  // a cancelled prompt saves nothing
  s.type("x");
  s.term.push_key(ctrl('G'));
  s.keys({ctrl('W')});
  assert(s.ed().is_modified());

  // replacing a modified buffer asks first
  s.term.push_key('n');
  s.keys({ctrl('R')});
  assert(s.text() == "hello\nx");
  s.term.push_key('y');
  s.term.push_key(EK_RETURN);
  s.keys({ctrl('R')});
  assert(s.text() == "hello\n");
  assert(!s.ed().is_modified());
  assert(s.editor.history().size() == 0);
  assert(s.point() == 0);

  // a failed load keeps the buffer and its history
  s.type("A");
  s.term.push_key('y');
  s.term.push_text("/sub.txt");
  s.term.push_key(EK_RETURN);
  s.keys({ctrl('R')});
  assert(s.text() == "Ahello\n");
  assert(s.display.message() == "Couldn't read file '" + missing + "/sub.txt'");
  assert(s.editor.history().size() == 1);

  // quit asks while modified
  s.term.push_key('n');
  s.keys({ctrl('Q')});
  assert(s.editor.alive());
  s.term.push_key('y');
  s.keys({ctrl('Q')});
  assert(!s.editor.alive());
  assert(s.term.pending_keys() == 0);

  Session clean;
  clean.editor.load_file(missing);
  assert(clean.text() == "hello\n");
  clean.keys({ctrl('Q')});
  assert(!clean.editor.alive());

  std::filesystem::remove_all(dir);
}

static void check_command_loop() {
  Session s;
  s.term.push_text("hi");
  s.term.push_keys({EK_RETURN, ctrl('Q'), 'y'});
  s.editor.command_loop(s.keymap);
  assert(s.text() == "hi\n");
  assert(!s.editor.alive());
  assert(s.term.line(0) == "hi");
}

int main() {
  check_typing_and_undo();
  check_motion();
  check_paging();
  check_deletion_and_paste();
  check_transpose_and_upcase();
  check_mark();
  check_unbound_and_misc();
  check_files_and_quit();
  check_command_loop();
  std::printf("test_editor: ok\n");
  return 0;
}
