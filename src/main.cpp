#include <iostream>
#include <string>
#include <glog/logging.h>
#include "display.hpp"
#include "editor.hpp"
#include "keymap.hpp"
#include "ncurses_terminal.hpp"
#include "settings.hpp"
#include "terminal.hpp"

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "Usage: medit [file]" << std::endl;
    return 2;
  }
  google::InitGoogleLogging(argv[0]);
  // the screen belongs to curses; log lines go to files only
  FLAGS_stderrthreshold = google::FATAL;

  Settings settings;
  std::string settings_msg;
  if (auto rc = default_settings_path(); rc && !load_settings(*rc, settings, settings_msg))
    LOG(WARNING) << "settings: " << settings_msg;

  Terminal terminal;
  NcursesTerminal term;
  Display display(term, settings);
  Editor editor(display, settings);
  LOG(INFO) << "medit started (" << editor.buffer().backend_name() << " backend)";
  editor.activate();
  if (!settings_msg.empty()) display.set_message(settings_msg);
  if (argc == 2) editor.load_file(argv[1]);
  else editor.buffer().update();

  const Keymap keymap = default_keymap();
  editor.command_loop(keymap);
  return 0;
}
