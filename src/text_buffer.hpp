#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer; the line source for conflict parsing.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Note: lines() hands out a read-only snapshot view; it is invalidated by
 *       the next mutation, so callers parse and project before editing.
 */
#include <filesystem>
#include <span>
#include <string>
#include <vector>

class TextBuffer {
public:
  TextBuffer();

  bool empty() const;
  int line_count() const;
  std::string line(int r) const;
  std::span<const std::string> lines() const { return lines_; }
  void ensure_not_empty();

  void init_from_lines(const std::vector<std::string>& lines);
  void init_from_lines(std::vector<std::string>&& lines);

  void insert_line(int row, const std::string& s);
  void erase_line(int row);
  void replace_line(int row, const std::string& s);

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  std::vector<std::string> lines_;
};
