#include "text_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <vector>
#include "posix_fd.hpp"
#include "file_reader.hpp"

std::string_view TextBuffer::backend_name() const {
  return core.get_name();
}

void TextBuffer::clear() { core.init_from_text(std::string_view()); }

void TextBuffer::init_from_text(std::string_view text) { core.init_from_text(text); }

std::string TextBuffer::text() const { return core.slice(0, core.length()); }

int TextBuffer::length() const { return static_cast<int>(core.length()); }
char TextBuffer::char_at(int pos) const { return core.char_at(static_cast<size_t>(pos)); }
void TextBuffer::set(int pos, char ch) { core.set_char(static_cast<size_t>(pos), ch); }

void TextBuffer::insert(int pos, char ch) {
  core.insert(static_cast<size_t>(pos), std::string_view(&ch, 1));
}

void TextBuffer::insert(int pos, std::string_view s) {
  core.insert(static_cast<size_t>(pos), s);
}

void TextBuffer::delete_char(int pos) { core.erase(static_cast<size_t>(pos), 1); }

void TextBuffer::delete_range(int pos, int len) {
  core.erase(static_cast<size_t>(pos), static_cast<size_t>(len));
}

std::string TextBuffer::get_range(int pos, int len) const {
  return core.slice(static_cast<size_t>(pos), static_cast<size_t>(len));
}

int TextBuffer::num_lines() const { return static_cast<int>(core.line_count()); }

int TextBuffer::get_row(int pos) const { return static_cast<int>(core.row_of(static_cast<size_t>(pos))); }

int TextBuffer::get_column(int pos) const {
  return pos - static_cast<int>(core.line_start(static_cast<size_t>(get_row(pos))));
}

int TextBuffer::get_line_length(int row) const {
  int start = static_cast<int>(core.line_start(static_cast<size_t>(row)));
  if (row + 1 < num_lines()) return static_cast<int>(core.line_start(static_cast<size_t>(row) + 1)) - start;
  return length() - start + 1;
}

int TextBuffer::get_pos(int row, int col) const {
  row = std::clamp(row, 0, num_lines() - 1);
  col = std::clamp(col, 0, get_line_length(row) - 1);
  return static_cast<int>(core.line_start(static_cast<size_t>(row))) + col;
}

std::string TextBuffer::fetch_line(int row) const {
  if (row < 0 || row >= num_lines()) return std::string();
  return get_range(get_pos(row, 0), get_line_length(row) - 1);
}

bool TextBuffer::read_file(const std::filesystem::path& path, std::string& msg) {
  std::string contents;
  if (!mmap_read_text(path, contents, msg)) return false;
  init_from_text(contents);
  return true;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd = UniqueFd::open(tmp.string(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (!ufd.valid()) {
    msg = "Couldn't write '" + path.string() + "'";
    return false;
  }
  std::vector<char> buf(static_cast<size_t>(TB_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto fail = [&]() {
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    msg = "Couldn't write '" + path.string() + "'";
    return false;
  };
  auto flush_buf = [&]() -> bool {
    const char* p = buf.data();
    size_t remain = used;
    while (remain > 0) {
      ssize_t w = ::write(ufd.get(), p, remain);
      if (w < 0) return false;
      p += w;
      remain -= static_cast<size_t>(w);
    }
    used = 0;
    return true;
  };
  size_t total = core.length();
  for (size_t pos = 0; pos < total; ) {
    size_t n = std::min(buf.size() - used, total - pos);
    for (size_t i = 0; i < n; ++i) buf[used + i] = core.char_at(pos + i);
    used += n;
    pos += n;
    if (used == buf.size() && !flush_buf()) return fail();
  }
  if (used > 0 && !flush_buf()) return fail();
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail();
#else
  if (::fdatasync(ufd.get()) != 0) return fail();
#endif
  if (!ufd.close()) return fail();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) return fail();
  msg = "saved file: " + path.string();
  return true;
}
