#pragma once
/*
 * Settings
 *
 * Purpose: user preferences read at startup from ~/.meditrc (or $MEDIT_RC).
 * Format: one "set name value" or "set name=value" per line; "#", "\"" and
 *         "//" start comments; a leading ':' is accepted.
 */
#include <filesystem>
#include <optional>
#include <string>

struct Settings {
  bool line_numbers = false;
  int tab_width = 8;
  // PAGEUP/PAGEDOWN move by the text height minus this many rows.
  int scroll_margin = 3;
};

// Apply one settings line. Returns false with msg set on a bad line;
// blank and comment lines succeed without effect.
bool apply_setting(const std::string& line, Settings& s, std::string& msg);

// Read and apply a settings file. Every line is applied; the result is
// false and msg names the first bad line if any failed.
bool load_settings(const std::filesystem::path& path, Settings& s, std::string& msg);

std::optional<std::filesystem::path> default_settings_path();
