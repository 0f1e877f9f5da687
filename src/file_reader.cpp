#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include "posix_fd.hpp"

bool mmap_read_text(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg) {
  UniqueFd fd = UniqueFd::open(path.string(), O_RDONLY);
  if (!fd.valid()) { msg = "Couldn't read file '" + path.string() + "'"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "Couldn't stat file '" + path.string() + "'"; return false; }
  if (!S_ISREG(st.st_mode)) { msg = "Not a regular file '" + path.string() + "'"; return false; }
  size_t n = static_cast<size_t>(st.st_size);
  std::string text;
  if (n > 0) {
    void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
    if (mem == MAP_FAILED) { msg = "Couldn't map file '" + path.string() + "'"; return false; }
    const char* data = static_cast<const char*>(mem);
    (void)::madvise(mem, n, MADV_SEQUENTIAL);
    text.reserve(n);
    size_t start = 0;
    for (size_t i = 0; i < n; ++i) {
      if (data[i] == '\n' && i > start && data[i - 1] == '\r') {
        text.append(data + start, i - 1 - start);
        start = i;
      }
    }
    text.append(data + start, n - start);
    ::munmap(mem, n);
  }
  out.swap(text);
  msg = "opened file: " + path.string();
  return true;
}
