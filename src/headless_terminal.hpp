#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records: one character and one color pair id per cell, the defined pairs,
 *          the cursor position; keys are fed from a script queue.
 */
#include "iterminal.hpp"
#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  bool define_pair(int color_pair_id, PackedColor fg, PackedColor bg) override;
  void move_cursor(int row, int col) override { cursor_ = {row, col}; }
  void refresh() override { ++refresh_count_; }
  void clear_to_eol(int row, int col) override;
  void fill_to_eol(int row, int col, int color_pair_id) override;
  std::optional<int> read_key() override;

  void push_keys(const std::string& keys);
  void push_key(int key) { keys_.push_back(key); }

  // screen row text with trailing spaces removed
  std::string row_text(int row) const;
  int pair_at(int row, int col) const;
  const std::pair<PackedColor, PackedColor>* pair_colors(int color_pair_id) const;
  std::pair<int, int> cursor() const { return cursor_; }
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, const std::string& text, int color_pair_id);
  int rows_;
  int cols_;
  std::vector<std::string> chars_;
  std::vector<std::vector<int>> pairs_;
  std::map<int, std::pair<PackedColor, PackedColor>> defined_;
  std::deque<int> keys_;
  std::pair<int, int> cursor_{0, 0};
  int refresh_count_ = 0;
};
