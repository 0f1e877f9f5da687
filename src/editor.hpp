#pragma once
/*
 * Editor
 *
 * Purpose: command layer over one EditBuffer. Commands are plain functions
 *          Editor& -> optional<Change>; obey() wraps each one with the
 *          point/mark snapshots and the display flush, and History records
 *          the result.
 * Note: the Editor never draws; everything visible goes through IDisplay.
 */
#include <functional>
#include <optional>
#include <string>
#include "types.hpp"
#include "change.hpp"
#include "edit_buffer.hpp"
#include "history.hpp"
#include "i_display.hpp"
#include "settings.hpp"

class Keymap;

class Editor {
public:
  using Action = std::function<std::optional<Change>(Editor&)>;

  Editor(IDisplay& display, const Settings& settings);
  Editor(const Editor&) = delete;
  Editor& operator=(const Editor&) = delete;

  // Attach the display and draw the first screen.
  void activate();
  // Load the startup file. A file that cannot be read still becomes the
  // buffer's filename, so the first save creates it.
  void load_file(const std::string& name);
  // Read keys and perform their commands until quit.
  void command_loop(const Keymap& keymap);

  // Run one command: reset the goal column, clear the message, snapshot,
  // execute, snapshot, flush. Returns the change wrapped as a Composite.
  std::optional<Change> obey(const Action& action);
  // obey() through History, recording the change for undo.
  bool perform(const Action& action);
  void undo();
  void redo();

  /* commands */
  std::optional<Change> move_command(Direction dir);
  std::optional<Change> delete_command(Direction dir);
  std::optional<Change> insert_command(char ch);
  std::optional<Change> paste_command();
  std::optional<Change> transpose_command();
  std::optional<Change> to_upper_command();
  std::optional<Change> mark_command();
  std::optional<Change> switch_mark_command();
  std::optional<Change> save_file_command();
  std::optional<Change> replace_file_command();
  std::optional<Change> choose_origin();
  std::optional<Change> quit();
  std::optional<Change> beep();

  EditBuffer& buffer() { return ed_; }
  const EditBuffer& buffer() const { return ed_; }
  const History<Action>& history() const { return history_; }
  const std::string& kill_text() const { return kill_; }
  bool alive() const { return alive_; }
  // Column that vertical motion aims for: the cached goal of the previous
  // vertical move, else the current column.
  int goal_column() const;

private:
  // true when the buffer is unmodified or the user agrees to lose changes.
  bool check_clean(const std::string& question);

  IDisplay& display_;
  const Settings& settings_;
  EditBuffer ed_;
  History<Action> history_;
  std::string kill_;
  bool alive_ = true;
  int goal_ = -1;
  int prev_goal_ = -1;
};
