#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include "i_text_buffer_core.hpp"

/*
  flat backend: one contiguous string and a table of line starts
  rebuilt after every edit; simple and steady, O(n) per edit
*/
class VectorTextBufferCore : public TextBufferCoreCRTP<VectorTextBufferCore> {
public:
  static constexpr std::string_view get_name_sv() { return "vector"; }

  VectorTextBufferCore() { reindex(); }

  void do_init_from_text(std::string_view text) { text_.assign(text); reindex(); }
  size_t do_length() const { return text_.size(); }
  char do_char_at(size_t pos) const { return text_[pos]; }
  void do_set_char(size_t pos, char ch) { text_[pos] = ch; reindex(); }
  void do_insert(size_t pos, std::string_view s) { text_.insert(pos, s); reindex(); }
  void do_erase(size_t pos, size_t len) { text_.erase(pos, len); reindex(); }
  std::string do_slice(size_t pos, size_t len) const { return text_.substr(pos, len); }
  size_t do_line_count() const { return starts_.size(); }
  size_t do_line_start(size_t row) const { return starts_[std::min(row, starts_.size() - 1)]; }
  size_t do_row_of(size_t pos) const {
    auto it = std::upper_bound(starts_.begin(), starts_.end(), pos);
    return static_cast<size_t>(it - starts_.begin()) - 1;
  }

  const std::string& raw_text() const { return text_; }
private:
  void reindex() {
    starts_.assign(1, 0);
    for (size_t i = 0; i < text_.size(); ++i) if (text_[i] == '\n') starts_.push_back(i + 1);
  }
  std::string text_;
  std::vector<size_t> starts_;
};

static_assert(TextBufferCoreCRTPConcept<VectorTextBufferCore>, "Vector backend must satisfy CRTP concept");
