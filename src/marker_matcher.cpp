#include "marker_matcher.hpp"

std::string_view marker_prefix(MarkerKind kind) {
  switch (kind) {
    case MarkerKind::Header: return "%%%%%%";
    case MarkerKind::Start: return "<<<<<<<";
    case MarkerKind::Ancestor: return "|||||||";
    case MarkerKind::Middle: return "=======";
    case MarkerKind::Finish: return ">>>>>>>";
    case MarkerKind::None: break;
  }
  return std::string_view();
}

bool is_marker(std::string_view line, MarkerKind kind) {
  if (kind == MarkerKind::None) return false;
  std::string_view p = marker_prefix(kind);
  return line.size() >= p.size() && line.compare(0, p.size(), p) == 0;
}

MarkerKind classify_marker(std::string_view line) {
  if (line.empty()) return MarkerKind::None;
  static constexpr MarkerKind order[] = {
    MarkerKind::Header, MarkerKind::Start, MarkerKind::Ancestor, MarkerKind::Middle, MarkerKind::Finish
  };
  for (MarkerKind k : order) {
    if (is_marker(line, k)) return k;
  }
  return MarkerKind::None;
}
