#include "file_reader.hpp"
#include "posix_io.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <algorithm>

void split_lines(std::string_view data, std::vector<std::string>& out_lines) {
  out_lines.reserve(out_lines.size() + static_cast<size_t>(std::count(data.begin(), data.end(), '\n')) + 1);
  size_t start = 0;
  const size_t n = data.size();
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data.substr(start, end - start));
    start = i + 1;
  }
  size_t end = n;
  if (end > start && data[end - 1] == '\r') end--;
  // a trailing newline does not open an extra line
  if (end > start || out_lines.empty()) out_lines.emplace_back(data.substr(start, end - start));
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) {
    out_lines.emplace_back("");
    msg = std::string("opened file: ") + path.string();
    return true;
  }
  MappedFile mf;
  if (!mf.map(fd.get(), n)) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  split_lines(mf.view(), out_lines);
  msg = std::string("opened file: ") + path.string();
  return true;
}
