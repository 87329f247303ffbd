#pragma once
/*
 * ConflictParser
 *
 * Purpose: single forward pass over a line snapshot that turns conflict
 *          marker blocks into ConflictBlock records (document order).
 * Ranges: all indices are zero-based line numbers, both ends inclusive.
 *   current  : range starts at the opening "<<<<<<<"/"%%%%%%" line,
 *              content is everything up to the next marker.
 *   ancestor : starts after "|||||||", runs up to "=======" (or finish).
 *   incoming : starts after "=======", content stops before ">>>>>>>",
 *              range_end is the ">>>>>>>" line itself.
 * Fallback: a block without "=======" still closes at ">>>>>>>"; incoming
 *           is then an empty section sitting on the finish line.
 *           A block that never reaches ">>>>>>>" is dropped and the scan ends.
 * Never throws; output is recomputed from scratch on every call.
 */
#include <optional>
#include <span>
#include <string>
#include <vector>

struct Section {
  int range_start = 0;
  int range_end = -1;
  int content_start = 0;
  int content_end = -1;

  bool has_content() const { return content_end >= content_start; }
  int content_size() const { return has_content() ? content_end - content_start + 1 : 0; }
  bool operator==(const Section&) const = default;
};

struct ConflictMarkers {
  int start_line = 0;
  std::optional<int> ancestor_line;
  std::optional<int> middle_line;
  int finish_line = 0;
  bool operator==(const ConflictMarkers&) const = default;
};

struct ConflictBlock {
  Section current;
  Section incoming;
  std::optional<Section> ancestor;
  ConflictMarkers markers;
  bool operator==(const ConflictBlock&) const = default;
};

std::vector<ConflictBlock> parse_conflicts(std::span<const std::string> lines);
