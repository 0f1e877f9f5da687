#pragma once
/*
 * TextBuffer
 *
 * Purpose: character-addressed text store with row/column mapping and file I/O.
 * Feature: safe writes (write .tmp -> fdatasync -> atomic rename).
 * Note: every line's length counts its terminating newline; the last line
 *       counts a virtual one, so get_pos(row, get_line_length(row) - 1) is
 *       always the end of the row.
 */
#include <string>
#include <string_view>
#include <filesystem>
#include "i_text_buffer_core.hpp"
#include "config.hpp"
#if TB_BACKEND == TB_BACKEND_GAP
#include "gap_text_buffer_core.hpp"
#else
#include "vector_text_buffer_core.hpp"
#endif

class TextBuffer {
public:
#if TB_BACKEND == TB_BACKEND_GAP
  using CoreType = GapTextBufferCore;
#else
  using CoreType = VectorTextBufferCore;
#endif
  static_assert(TextBufferCoreCRTPConcept<CoreType>, "Selected backend must satisfy CRTP concept");
  CoreType core;

  std::string_view backend_name() const;
  void clear();
  void init_from_text(std::string_view text);
  std::string text() const;

  int length() const;
  char char_at(int pos) const;
  void set(int pos, char ch);
  void insert(int pos, char ch);
  void insert(int pos, std::string_view s);
  void delete_char(int pos);
  void delete_range(int pos, int len);
  std::string get_range(int pos, int len) const;

  int num_lines() const;
  int get_row(int pos) const;
  int get_column(int pos) const;
  int get_pos(int row, int col) const;
  int get_line_length(int row) const;
  std::string fetch_line(int row) const;

  bool read_file(const std::filesystem::path& path, std::string& msg);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;
};
