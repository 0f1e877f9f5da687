#pragma once
/*
 * Keys
 *
 * Purpose: backend-independent key codes delivered by ITerminal::get_key.
 * Note: plain characters and control characters are passed through as-is;
 *       special keys live above the 8-bit range so they never collide.
 */

constexpr int ctrl(char c) { return c & 0x1f; }

enum EditorKey : int {
  EK_RETURN    = '\n',
  EK_TAB       = '\t',
  EK_BACKSPACE = 127,
  EK_LEFT      = 0x1000,
  EK_RIGHT,
  EK_UP,
  EK_DOWN,
  EK_HOME,
  EK_END,
  EK_PAGEUP,
  EK_PAGEDOWN,
  EK_CTRLHOME,
  EK_CTRLEND,
  EK_DEL,
  EK_RESIZE,
  EK_UNKNOWN
};

inline bool is_printable_key(int key) {
  return (key >= 32 && key <= 126) || key == EK_TAB;
}
