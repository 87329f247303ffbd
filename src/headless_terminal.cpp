#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(std::max(1, rows)), cols_(std::max(1, cols)) {
  clear();
}

void HeadlessTerminal::clear() {
  chars_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' '));
  pairs_.assign(static_cast<size_t>(rows_), std::vector<int>(static_cast<size_t>(cols_), kDefaultPair));
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int color_pair_id) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    chars_[static_cast<size_t>(row)][static_cast<size_t>(c)] = text[i];
    pairs_[static_cast<size_t>(row)][static_cast<size_t>(c)] = color_pair_id;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, kDefaultPair);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, color_pair_id);
}

bool HeadlessTerminal::define_pair(int color_pair_id, PackedColor fg, PackedColor bg) {
  if (color_pair_id <= kDefaultPair) return false;
  defined_[color_pair_id] = {fg, bg};
  return true;
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (col < 0) col = 0;
  if (col >= cols_) return;
  put(row, col, std::string(static_cast<size_t>(cols_ - col), ' '), kDefaultPair);
}

void HeadlessTerminal::fill_to_eol(int row, int col, int color_pair_id) {
  if (col < 0) col = 0;
  if (col >= cols_) return;
  put(row, col, std::string(static_cast<size_t>(cols_ - col), ' '), color_pair_id);
}

std::optional<int> HeadlessTerminal::read_key() {
  if (keys_.empty()) return std::nullopt;
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (char c : keys) keys_.push_back(static_cast<unsigned char>(c));
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s = chars_[static_cast<size_t>(row)];
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

int HeadlessTerminal::pair_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return kDefaultPair;
  return pairs_[static_cast<size_t>(row)][static_cast<size_t>(col)];
}

const std::pair<PackedColor, PackedColor>* HeadlessTerminal::pair_colors(int color_pair_id) const {
  auto it = defined_.find(color_pair_id);
  return it == defined_.end() ? nullptr : &it->second;
}
