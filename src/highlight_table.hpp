#pragma once
/*
 * HighlightTable
 *
 * Purpose: resolve named highlight groups (DiffText, DiffAdd, ...) to colors.
 * Theme: ConflictTheme holds the body and label background of every region
 *        kind; unresolved groups fall back to fixed defaults and label colors
 *        are the body colors darkened by shade_color.
 */
#include <optional>
#include <string>
#include <unordered_map>
#include "color_shader.hpp"
#include "config.hpp"
#include "region_projector.hpp"

class HighlightTable {
public:
  void set(const std::string& group, PackedColor color) { groups_[group] = color & 0xFFFFFFu; }
  bool erase(const std::string& group) { return groups_.erase(group) > 0; }
  std::optional<PackedColor> lookup(const std::string& group) const;
  size_t size() const { return groups_.size(); }
private:
  std::unordered_map<std::string, PackedColor> groups_;
};

struct ConflictGroups {
  std::string current = MC_DEFAULT_CURRENT_GROUP;
  std::string incoming = MC_DEFAULT_INCOMING_GROUP;
  std::string ancestor = MC_DEFAULT_ANCESTOR_GROUP;

  std::string& for_kind(RegionKind kind);
};

struct RegionColors {
  PackedColor body = 0;
  PackedColor label = 0;
};

struct ConflictTheme {
  RegionColors current;
  RegionColors incoming;
  RegionColors ancestor;

  const RegionColors& for_kind(RegionKind kind) const;
};

PackedColor default_region_color(RegionKind kind);

ConflictTheme resolve_conflict_theme(const HighlightTable& table,
                                     const ConflictGroups& groups,
                                     int label_shade = MC_DEFAULT_LABEL_SHADE);
