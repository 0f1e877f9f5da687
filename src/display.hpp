#pragma once
/*
 * Display
 *
 * Purpose: IDisplay on top of an ITerminal: keeps the viewport (origin row,
 *          left column), redraws as little as the reported damage allows,
 *          and runs status-line prompts.
 */
#include <optional>
#include <string>
#include "i_display.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "settings.hpp"

class Display : public IDisplay {
public:
  Display(ITerminal& term, const Settings& settings);

  void show(const EditBuffer& buf) override;
  int get_key() override;
  void refresh(Damage damage, int row, int col) override;
  void scroll(int amount) override;
  void choose_origin() override;
  void set_message(const std::string& msg) override;
  void clear_message() override;
  void beep() override;
  bool ask(const std::string& question) override;
  std::optional<std::string> read_string(const std::string& prompt, const std::string& def) override;
  int text_height() const override;

  int origin() const { return origin_; }
  int left_col() const { return left_col_; }
  const std::string& message() const { return message_; }

private:
  std::string status_text(int row, int col) const;
  void prompt_line(const std::string& text);

  ITerminal& term_;
  const Settings& settings_;
  Renderer renderer_;
  const EditBuffer* buf_ = nullptr;
  int origin_ = 0;
  int left_col_ = 0;
  int gutter_ = 0;
  bool rewrite_pending_ = true;
  bool recenter_ = false;
  std::string message_;
};
