#pragma once
/*
 * RegionProjector
 *
 * Purpose: turn parsed ConflictBlocks into render-only RegionDescriptors.
 * Convention: paint_range is inclusive on both ends for every kind.
 * Labels: current sits on the opening marker line, incoming on the closing
 *         marker line, ancestor on ancestor.range_start. The label text is
 *         the anchor line followed by " (Current)" / " (Incoming)" / " (Base)".
 */
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "conflict_parser.hpp"
#include "types.hpp"

enum class RegionKind { Current, Incoming, Ancestor };

struct RegionDescriptor {
  RegionKind kind = RegionKind::Current;
  LineRange paint_range;
  std::string label_text;
  int label_line = 0;
  bool operator==(const RegionDescriptor&) const = default;
};

std::string_view region_role(RegionKind kind);     // "Current" / "Incoming" / "Base"
std::string_view region_fallback(RegionKind kind); // "Current" / "Incoming" / "Ancestor"

// order per block: Current, Ancestor (when present), Incoming
std::vector<RegionDescriptor> project_block(std::span<const std::string> lines, const ConflictBlock& block);
std::vector<RegionDescriptor> project_regions(std::span<const std::string> lines,
                                              const std::vector<ConflictBlock>& blocks);
