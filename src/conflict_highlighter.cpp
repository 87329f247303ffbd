#include "conflict_highlighter.hpp"

void ConflictHighlighter::refresh(std::span<const std::string> lines) {
  if (!enabled_) { clear(); return; }
  blocks_ = parse_conflicts(lines);
  regions_ = project_regions(lines, blocks_);
}

void ConflictHighlighter::clear() {
  blocks_.clear();
  regions_.clear();
}

void ConflictHighlighter::set_enabled(bool on) {
  enabled_ = on;
  if (!enabled_) clear();
}

const RegionDescriptor* ConflictHighlighter::region_at(int row) const {
  for (const auto& r : regions_) {
    if (r.paint_range.contains(row)) return &r;
  }
  return nullptr;
}

const RegionDescriptor* ConflictHighlighter::label_at(int row) const {
  // a later label on the same row wins, as with overlapping overlays
  const RegionDescriptor* hit = nullptr;
  for (const auto& r : regions_) {
    if (r.label_line == row) hit = &r;
  }
  return hit;
}

std::optional<int> ConflictHighlighter::next_conflict(int row) const {
  for (const auto& b : blocks_) {
    if (b.markers.start_line > row) return b.markers.start_line;
  }
  return std::nullopt;
}

std::optional<int> ConflictHighlighter::prev_conflict(int row) const {
  for (auto it = blocks_.rbegin(); it != blocks_.rend(); ++it) {
    if (it->markers.start_line < row) return it->markers.start_line;
  }
  return std::nullopt;
}
