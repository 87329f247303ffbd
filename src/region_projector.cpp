#include "region_projector.hpp"
#include <iterator>

std::string_view region_role(RegionKind kind) {
  switch (kind) {
    case RegionKind::Current: return "Current";
    case RegionKind::Incoming: return "Incoming";
    case RegionKind::Ancestor: return "Base";
  }
  return "";
}

std::string_view region_fallback(RegionKind kind) {
  switch (kind) {
    case RegionKind::Current: return "Current";
    case RegionKind::Incoming: return "Incoming";
    case RegionKind::Ancestor: return "Ancestor";
  }
  return "";
}

static std::string make_label(std::span<const std::string> lines, RegionKind kind, int row) {
  std::string label;
  if (row >= 0 && row < static_cast<int>(lines.size())) label = lines[static_cast<size_t>(row)];
  else label = std::string(region_fallback(kind));
  label += " (";
  label += region_role(kind);
  label += ")";
  return label;
}

static RegionDescriptor make_region(std::span<const std::string> lines, RegionKind kind,
                                    const Section& s, int label_line) {
  RegionDescriptor d;
  d.kind = kind;
  d.paint_range = { s.range_start, s.range_end };
  d.label_line = label_line;
  d.label_text = make_label(lines, kind, label_line);
  return d;
}

std::vector<RegionDescriptor> project_block(std::span<const std::string> lines, const ConflictBlock& block) {
  std::vector<RegionDescriptor> out;
  out.reserve(3);
  out.push_back(make_region(lines, RegionKind::Current, block.current, block.current.range_start));
  if (block.ancestor) {
    out.push_back(make_region(lines, RegionKind::Ancestor, *block.ancestor, block.ancestor->range_start));
  }
  out.push_back(make_region(lines, RegionKind::Incoming, block.incoming, block.incoming.range_end));
  return out;
}

std::vector<RegionDescriptor> project_regions(std::span<const std::string> lines,
                                              const std::vector<ConflictBlock>& blocks) {
  std::vector<RegionDescriptor> out;
  out.reserve(blocks.size() * 3);
  for (const auto& b : blocks) {
    auto rs = project_block(lines, b);
    out.insert(out.end(), std::make_move_iterator(rs.begin()), std::make_move_iterator(rs.end()));
  }
  return out;
}
