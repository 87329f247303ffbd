#include "text_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "posix_io.hpp"
#include "file_reader.hpp"
#include "config.hpp"

TextBuffer::TextBuffer() {}

bool TextBuffer::empty() const { return lines_.empty(); }
int TextBuffer::line_count() const { return static_cast<int>(lines_.size()); }

std::string TextBuffer::line(int r) const {
  if (r < 0 || r >= line_count()) return std::string();
  return lines_[static_cast<size_t>(r)];
}

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(const std::vector<std::string>& src) {
  lines_ = src;
  ensure_not_empty();
}

void TextBuffer::init_from_lines(std::vector<std::string>&& src) {
  lines_ = std::move(src);
  ensure_not_empty();
}

void TextBuffer::insert_line(int row, const std::string& s) {
  size_t pos = std::min(static_cast<size_t>(std::max(0, row)), lines_.size());
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), s);
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  std::vector<std::string> ls;
  ok = mmap_readlines(path, ls, msg);
  if (!ok) {
    b.ensure_not_empty();
    return b;
  }
  b.init_from_lines(std::move(ls));
  return b;
}

static bool write_all(int fd, const char* p, size_t len) {
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w < 0) return false;
    p += w;
    len -= static_cast<size_t>(w);
  }
  return true;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::vector<char> chunk(static_cast<size_t>(MC_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto flush = [&]() {
    bool ok = write_all(ufd.get(), chunk.data(), used);
    used = 0;
    return ok;
  };
  for (const auto& s : lines_) {
    // every line is newline-terminated on disk
    if (s.size() + 1 > chunk.size() - used) {
      if (!flush()) { msg = std::string("write file failed: ") + tmp.string(); return false; }
    }
    if (s.size() + 1 > chunk.size()) {
      if (!write_all(ufd.get(), s.data(), s.size()) || !write_all(ufd.get(), "\n", 1)) {
        msg = std::string("write file failed: ") + tmp.string();
        return false;
      }
      continue;
    }
    std::memcpy(chunk.data() + used, s.data(), s.size());
    used += s.size();
    chunk[used++] = '\n';
  }
  if (used > 0 && !flush()) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
