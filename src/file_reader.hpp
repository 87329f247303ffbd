#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 *        On success out_lines holds at least one (possibly empty) line.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);

// split already-loaded text the same way (used by the reader and tests)
void split_lines(std::string_view data, std::vector<std::string>& out_lines);
