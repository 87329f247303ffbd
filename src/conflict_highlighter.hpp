#pragma once
/*
 * ConflictHighlighter
 *
 * Purpose: reparse-and-render glue between a line snapshot and the Renderer.
 * Usage: call refresh(lines) whenever the buffer is loaded, changed or
 *        redrawn; the previous result is always thrown away (full rescan).
 * Note: holds only the last result for painting; parse/project stay pure.
 */
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "conflict_parser.hpp"
#include "region_projector.hpp"

class ConflictHighlighter {
public:
  void refresh(std::span<const std::string> lines);
  void clear();

  void set_enabled(bool on);
  bool enabled() const { return enabled_; }

  const std::vector<ConflictBlock>& blocks() const { return blocks_; }
  const std::vector<RegionDescriptor>& regions() const { return regions_; }

  // body region painted on row (nullptr when none)
  const RegionDescriptor* region_at(int row) const;
  // region whose label overlays row (nullptr when none)
  const RegionDescriptor* label_at(int row) const;

  std::optional<int> next_conflict(int row) const;
  std::optional<int> prev_conflict(int row) const;

private:
  bool enabled_ = true;
  std::vector<ConflictBlock> blocks_;
  std::vector<RegionDescriptor> regions_;
};
