#pragma once
/*
 * Keymap
 *
 * Purpose: key code -> editor command. Keys with no binding run the
 *          fallback command (a beep in the default keymap).
 */
#include <cstddef>
#include <unordered_map>
#include <utility>
#include "editor.hpp"

class Keymap {
public:
  explicit Keymap(Editor::Action fallback) : fallback_(std::move(fallback)) {}

  void bind(int key, Editor::Action action) { bindings_[key] = std::move(action); }
  bool contains(int key) const { return bindings_.count(key) != 0; }
  const Editor::Action& lookup(int key) const {
    auto it = bindings_.find(key);
    return it == bindings_.end() ? fallback_ : it->second;
  }
  size_t size() const { return bindings_.size(); }

private:
  std::unordered_map<int, Editor::Action> bindings_;
  Editor::Action fallback_;
};

// The standard emacs-flavoured bindings.
Keymap default_keymap();
