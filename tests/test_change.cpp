#include "change.hpp"
#include <cassert>
#include <cstdio>
#include <string>

static void check_mergeable_insertion() {
  Change a = Change::mergeable_insertion(3, 'a');
  assert(a.amalgamate(Change::mergeable_insertion(4, 'b')));
  assert(a.text == "ab");
  assert(a.amalgamate(Change::mergeable_insertion(5, '\n')));
  assert(a.text == "ab\n");
  // a newline ends the run
  assert(!a.amalgamate(Change::mergeable_insertion(6, 'c')));
  assert(a.text == "ab\n");

  Change b = Change::mergeable_insertion(0, 'x');
  assert(!b.amalgamate(Change::mergeable_insertion(5, 'y')));   // not adjacent
  assert(!b.amalgamate(Change::mergeable_insertion(0, 'y')));   // before, not after
  assert(!b.amalgamate(Change::insertion(1, "y")));             // different kind
  assert(b.text == "x");

  Change d = Change::deletion(0, "q");
  assert(!d.amalgamate(Change::deletion(0, "r")));
  Change t = Change::transposition(2);
  assert(!t.amalgamate(Change::transposition(2)));
}

static void check_composite_amalgamation() {
  Change c = Change::composite({0, 0}, Change::mergeable_insertion(0, 'a'), {1, 1});
  assert(c.amalgamate(Change::composite({1, 1}, Change::mergeable_insertion(1, 'b'), {2, 2})));
  assert(c.inner->text == "ab");
  assert(c.before.point == 0);
  assert(c.after.point == 2 && c.after.mark == 2);

  // inner kinds differ: refused, untouched
  assert(!c.amalgamate(Change::composite({2, 2}, Change::deletion(1, "b"), {1, 1})));
  assert(c.inner->text == "ab");
  assert(c.after.point == 2);
}

static void check_undo_redo() {
  EditBuffer ed;
  ed.insert(0, std::string_view("hello world"));
  ed.set_point(5);
  ed.set_mark(0);
  Memento before = ed.get_state();

  ed.insert(5, std::string_view(","));
  ed.set_point(6);
  Change ins = Change::composite(before, Change::insertion(5, ","), ed.get_state());
  assert(ed.text() == "hello, world");
  ins.undo(ed);
  assert(ed.text() == "hello world");
  assert(ed.point() == 5 && ed.mark() == 0);
  ins.redo(ed);
  assert(ed.text() == "hello, world");
  assert(ed.point() == 6);

  Change del = Change::deletion(0, "hello");
  del.redo(ed);
  assert(ed.text() == ", world");
  del.undo(ed);
  assert(ed.text() == "hello, world");

  Change up = Change::uppercase(7, "world");
  up.redo(ed);
  assert(ed.text() == "hello, WORLD");
  up.undo(ed);
  assert(ed.text() == "hello, world");
}

// Transposition is its own inverse.
static void check_transposition() {
  EditBuffer ed;
  ed.insert(0, std::string_view("hello\nworld"));
  ed.set_point(5);
  Memento before = ed.get_state();
  ed.transpose(5);
  assert(ed.text() == "helol\nworld");
  Change t = Change::composite(before, Change::transposition(5), ed.get_state());

  t.undo(ed);
  assert(ed.text() == "hello\nworld");
  assert(ed.point() == 5);
  t.redo(ed);
  assert(ed.text() == "helol\nworld");
  t.redo(ed);
  assert(ed.text() == "hello\nworld");
}

int main() {
  check_mergeable_insertion();
  check_composite_amalgamation();
  check_undo_redo();
  check_transposition();
  assert(std::string(change_type_name(Change::Composite)) == "composite");
  std::printf("test_change: ok\n");
  return 0;
}
