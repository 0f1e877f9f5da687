#include "keymap.hpp"
#include "keys.hpp"

static Editor::Action move_to(Direction dir) {
  return [dir](Editor& e) { return e.move_command(dir); };
}

static Editor::Action delete_toward(Direction dir) {
  return [dir](Editor& e) { return e.delete_command(dir); };
}

static Editor::Action self_insert(char ch) {
  return [ch](Editor& e) { return e.insert_command(ch); };
}

static Editor::Action command(std::optional<Change> (Editor::*fn)()) {
  return [fn](Editor& e) { return (e.*fn)(); };
}

Keymap default_keymap() {
  Keymap km(command(&Editor::beep));

  for (int ch = 0; ch < 128; ++ch)
    if (is_printable_key(ch)) km.bind(ch, self_insert(static_cast<char>(ch)));
  km.bind(EK_RETURN, self_insert('\n'));

  km.bind(EK_LEFT, move_to(Direction::Left));
  km.bind(EK_RIGHT, move_to(Direction::Right));
  km.bind(EK_UP, move_to(Direction::Up));
  km.bind(EK_DOWN, move_to(Direction::Down));
  km.bind(EK_HOME, move_to(Direction::Home));
  km.bind(EK_END, move_to(Direction::End));
  km.bind(EK_PAGEUP, move_to(Direction::PageUp));
  km.bind(EK_PAGEDOWN, move_to(Direction::PageDown));
  km.bind(EK_CTRLHOME, move_to(Direction::CtrlHome));
  km.bind(EK_CTRLEND, move_to(Direction::CtrlEnd));
  km.bind(ctrl('A'), move_to(Direction::Home));
  km.bind(ctrl('E'), move_to(Direction::End));
  km.bind(ctrl('B'), move_to(Direction::Left));
  km.bind(ctrl('F'), move_to(Direction::Right));
  km.bind(ctrl('N'), move_to(Direction::Down));
  km.bind(ctrl('P'), move_to(Direction::Up));

  km.bind(EK_BACKSPACE, delete_toward(Direction::Left));
  km.bind(EK_DEL, delete_toward(Direction::Right));
  km.bind(ctrl('D'), delete_toward(Direction::Right));
  km.bind(ctrl('K'), delete_toward(Direction::End));
  km.bind(ctrl('V'), command(&Editor::paste_command));

  km.bind(ctrl('@'), command(&Editor::mark_command));
  km.bind(ctrl('O'), command(&Editor::switch_mark_command));
  km.bind(ctrl('T'), command(&Editor::transpose_command));
  km.bind(ctrl('U'), command(&Editor::to_upper_command));
  km.bind(ctrl('G'), command(&Editor::beep));
  km.bind(ctrl('L'), command(&Editor::choose_origin));
  km.bind(EK_RESIZE, command(&Editor::choose_origin));
  km.bind(ctrl('W'), command(&Editor::save_file_command));
  km.bind(ctrl('R'), command(&Editor::replace_file_command));
  km.bind(ctrl('Q'), command(&Editor::quit));

  km.bind(ctrl('Z'), [](Editor& e) -> std::optional<Change> { e.undo(); return std::nullopt; });
  km.bind(ctrl('Y'), [](Editor& e) -> std::optional<Change> { e.redo(); return std::nullopt; });
  return km;
}
