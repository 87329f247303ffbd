#include "conflict_parser.hpp"
#include "marker_matcher.hpp"

namespace {

struct OpenBlock {
  int start = 0;
  std::optional<int> ancestor;
  std::optional<int> middle;
};

ConflictBlock close_block(const OpenBlock& ob, int finish) {
  ConflictBlock b;
  b.markers.start_line = ob.start;
  b.markers.ancestor_line = ob.ancestor;
  b.markers.middle_line = ob.middle;
  b.markers.finish_line = finish;

  // first boundary after the current side
  int current_stop = ob.ancestor ? *ob.ancestor : (ob.middle ? *ob.middle : finish);
  b.current.range_start = ob.start;
  b.current.content_start = ob.start + 1;
  b.current.content_end = current_stop - 1;
  b.current.range_end = b.current.content_end;

  if (ob.ancestor) {
    Section a;
    a.range_start = *ob.ancestor + 1;
    a.content_start = a.range_start;
    a.content_end = (ob.middle ? *ob.middle : finish) - 1;
    a.range_end = a.content_end;
    b.ancestor = a;
  }

  // without a divider incoming degenerates to an empty section on the finish line
  b.incoming.range_start = ob.middle ? *ob.middle + 1 : finish;
  b.incoming.content_start = b.incoming.range_start;
  b.incoming.content_end = finish - 1;
  b.incoming.range_end = finish;
  return b;
}

} // namespace

std::vector<ConflictBlock> parse_conflicts(std::span<const std::string> lines) {
  std::vector<ConflictBlock> out;
  const int n = static_cast<int>(lines.size());
  int i = 0;
  while (i < n) {
    const std::string& s = lines[static_cast<size_t>(i)];
    if (!is_marker(s, MarkerKind::Header) && !is_marker(s, MarkerKind::Start)) { ++i; continue; }

    OpenBlock ob;
    ob.start = i;
    int finish = -1;
    for (int j = i + 1; j < n; ++j) {
      const std::string& lj = lines[static_cast<size_t>(j)];
      if (!ob.middle && !ob.ancestor && is_marker(lj, MarkerKind::Ancestor)) {
        ob.ancestor = j;
      } else if (!ob.middle && is_marker(lj, MarkerKind::Middle)) {
        ob.middle = j;
      } else if (is_marker(lj, MarkerKind::Finish)) {
        finish = j;
        break;
      }
    }
    // unterminated: no later start can close either, so the scan is over
    if (finish < 0) break;
    out.push_back(close_block(ob, finish));
    i = finish + 1;
  }
  return out;
}
