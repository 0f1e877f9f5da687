#pragma once
/*
 * IDisplay
 *
 * Purpose: what the editing engine needs from the screen: damage-driven
 * refresh, viewport control, status messages, bell and blocking prompts.
 */
#include <optional>
#include <string>
#include "types.hpp"

class EditBuffer;

class IDisplay {
public:
  virtual ~IDisplay() = default;
  virtual void show(const EditBuffer& buf) = 0;
  virtual int get_key() = 0;
  virtual void refresh(Damage damage, int row, int col) = 0;
  virtual void scroll(int amount) = 0;
  virtual void choose_origin() = 0;
  virtual void set_message(const std::string& msg) = 0;
  virtual void clear_message() = 0;
  virtual void beep() = 0;
  virtual bool ask(const std::string& question) = 0;
  // Returns std::nullopt when the user cancels.
  virtual std::optional<std::string> read_string(const std::string& prompt, const std::string& def) = 0;
  // Number of screen rows available for text.
  virtual int text_height() const = 0;
};
