#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/Viewport/LineRange).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class Mode { Normal, Insert, Command };

struct Cursor { int row = 0; int col = 0; };
struct Viewport { int top_line = 0; int left_col = 0; };

// zero-based, both ends inclusive; empty when end < start
struct LineRange {
  int start = 0;
  int end = -1;
  bool empty() const { return end < start; }
  bool contains(int row) const { return row >= start && row <= end; }
  bool operator==(const LineRange&) const = default;
};
