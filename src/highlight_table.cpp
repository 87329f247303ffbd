#include "highlight_table.hpp"

std::optional<PackedColor> HighlightTable::lookup(const std::string& group) const {
  if (group.empty()) return std::nullopt;
  auto it = groups_.find(group);
  if (it == groups_.end()) return std::nullopt;
  return it->second;
}

std::string& ConflictGroups::for_kind(RegionKind kind) {
  switch (kind) {
    case RegionKind::Incoming: return incoming;
    case RegionKind::Ancestor: return ancestor;
    case RegionKind::Current: break;
  }
  return current;
}

const RegionColors& ConflictTheme::for_kind(RegionKind kind) const {
  switch (kind) {
    case RegionKind::Incoming: return incoming;
    case RegionKind::Ancestor: return ancestor;
    case RegionKind::Current: break;
  }
  return current;
}

PackedColor default_region_color(RegionKind kind) {
  switch (kind) {
    case RegionKind::Incoming: return MC_DEFAULT_INCOMING_BG;
    case RegionKind::Ancestor: return MC_DEFAULT_ANCESTOR_BG;
    case RegionKind::Current: break;
  }
  return MC_DEFAULT_CURRENT_BG;
}

static RegionColors resolve_one(const HighlightTable& table, const std::string& group,
                                RegionKind kind, int label_shade) {
  RegionColors c;
  c.body = table.lookup(group).value_or(default_region_color(kind));
  c.label = shade_color(c.body, label_shade);
  return c;
}

ConflictTheme resolve_conflict_theme(const HighlightTable& table,
                                     const ConflictGroups& groups,
                                     int label_shade) {
  ConflictTheme t;
  t.current = resolve_one(table, groups.current, RegionKind::Current, label_shade);
  t.incoming = resolve_one(table, groups.incoming, RegionKind::Incoming, label_shade);
  t.ancestor = resolve_one(table, groups.ancestor, RegionKind::Ancestor, label_shade);
  return t;
}
