#pragma once
#include <string>
#include <string_view>
#include "i_text_buffer_core.hpp"
#include "gap_buffer.hpp"
#include "line_index.hpp"

/*
  gap buffer backend: cheap runs of edits at one position,
  line starts kept in a block index
*/
class GapTextBufferCore : public TextBufferCoreCRTP<GapTextBufferCore> {
public:
  GapBuffer gb;
  LineIndex li;
  static constexpr std::string_view get_name_sv() { return "gap"; }

  GapTextBufferCore();
  void init_from_text(std::string_view text);
  void insert(size_t pos, std::string_view s);
  void erase(size_t pos, size_t len);
  void set_char(size_t pos, char ch);

  /*forward to CRTP impl*/
  void do_init_from_text(std::string_view text) { init_from_text(text); }
  size_t do_length() const { return gb.length(); }
  char do_char_at(size_t pos) const { return gb.at(pos); }
  void do_set_char(size_t pos, char ch) { set_char(pos, ch); }
  void do_insert(size_t pos, std::string_view s) { insert(pos, s); }
  void do_erase(size_t pos, size_t len) { erase(pos, len); }
  std::string do_slice(size_t pos, size_t len) const { return gb.slice(pos, len); }
  size_t do_line_count() const { return li.line_count(); }
  size_t do_line_start(size_t row) const { return li.line_start(row); }
  size_t do_row_of(size_t pos) const { return li.row_of(pos); }
};

static_assert(TextBufferCoreCRTPConcept<GapTextBufferCore>, "Gap backend must satisfy CRTP concept");
