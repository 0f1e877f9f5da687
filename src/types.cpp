#include "types.hpp"

const char* damage_name(Damage d) {
  switch (d) {
    case Damage::Clean: return "clean";
    case Damage::RewriteLine: return "rewrite-line";
    case Damage::Rewrite: return "rewrite";
  }
  return "?";
}

const char* direction_name(Direction d) {
  switch (d) {
    case Direction::Left: return "left";
    case Direction::Right: return "right";
    case Direction::Up: return "up";
    case Direction::Down: return "down";
    case Direction::Home: return "home";
    case Direction::End: return "end";
    case Direction::PageUp: return "pageup";
    case Direction::PageDown: return "pagedown";
    case Direction::CtrlHome: return "ctrl-home";
    case Direction::CtrlEnd: return "ctrl-end";
  }
  return "?";
}
