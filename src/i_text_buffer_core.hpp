#pragma once
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>

/*
 * Character storage backends share this static interface. Offsets are
 * absolute character positions; rows are 0-based and a row starts after
 * each '\n'. Callers guarantee offsets are in range.
 */
template <typename Derived>
class TextBufferCoreCRTP {
public:
  std::string_view get_name() const { return as_const_derived().get_name_sv(); }
  void init_from_text(std::string_view text) { as_derived().do_init_from_text(text); }
  size_t length() const { return as_const_derived().do_length(); }
  char char_at(size_t pos) const { return as_const_derived().do_char_at(pos); }
  void set_char(size_t pos, char ch) { as_derived().do_set_char(pos, ch); }
  /*insert*/
  void insert(size_t pos, std::string_view s) { as_derived().do_insert(pos, s); }
  /*erase*/
  void erase(size_t pos, size_t len) { as_derived().do_erase(pos, len); }
  /*lines*/
  std::string slice(size_t pos, size_t len) const { return as_const_derived().do_slice(pos, len); }
  size_t line_count() const { return as_const_derived().do_line_count(); }
  size_t line_start(size_t row) const { return as_const_derived().do_line_start(row); }
  size_t row_of(size_t pos) const { return as_const_derived().do_row_of(pos); }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept TextBufferCoreCRTPConcept =
    std::derived_from<T, TextBufferCoreCRTP<T>> &&
    requires(T& t, const T& ct, size_t n, char ch, std::string_view sv) {
      { T::get_name_sv() } -> std::convertible_to<std::string_view>;
      t.do_init_from_text(sv);
      { ct.do_length() } -> std::same_as<size_t>;
      { ct.do_char_at(n) } -> std::same_as<char>;
      t.do_set_char(n, ch);
      t.do_insert(n, sv);
      t.do_erase(n, n);
      { ct.do_slice(n, n) } -> std::same_as<std::string>;
      { ct.do_line_count() } -> std::same_as<size_t>;
      { ct.do_line_start(n) } -> std::same_as<size_t>;
      { ct.do_row_of(n) } -> std::same_as<size_t>;
    };
