#include "region_projector.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_two_way_regions() {
  std::vector<std::string> lines = {"a", "<<<<<<< ours", "x", "=======", "y", ">>>>>>> theirs", "b"};
  auto rs = project_regions(lines, parse_conflicts(lines));
  assert(rs.size() == 2);
  assert(rs[0].kind == RegionKind::Current);
  assert(rs[0].paint_range == (LineRange{1, 2}));
  assert(rs[0].label_line == 1);
  assert(rs[0].label_text == "<<<<<<< ours (Current)");
  assert(rs[1].kind == RegionKind::Incoming);
  assert(rs[1].paint_range == (LineRange{4, 5}));
  assert(rs[1].label_line == 5);
  assert(rs[1].label_text == ">>>>>>> theirs (Incoming)");
  // the divider line is never painted
  for (const auto& r : rs) assert(!r.paint_range.contains(3));
}

static void test_ancestor_region() {
  std::vector<std::string> lines = {"<<<<<<<", "x", "||||||| base", "old", "=======", "y", ">>>>>>>"};
  auto rs = project_regions(lines, parse_conflicts(lines));
  assert(rs.size() == 3);
  assert(rs[0].kind == RegionKind::Current);
  assert(rs[0].paint_range == (LineRange{0, 1}));
  assert(rs[1].kind == RegionKind::Ancestor);
  assert(rs[1].paint_range == (LineRange{3, 3}));
  assert(rs[1].label_line == 3);
  assert(rs[1].label_text == "old (Base)");
  assert(rs[2].kind == RegionKind::Incoming);
  assert(rs[2].paint_range == (LineRange{5, 6}));
}

static void test_fallback_label() {
  // projecting against a shorter snapshot than the one that was parsed
  std::vector<std::string> lines = {"<<<<<<<", "x", "=======", "y", ">>>>>>>"};
  auto blocks = parse_conflicts(lines);
  std::vector<std::string> shorter = {"<<<<<<<", "x"};
  auto rs = project_block(shorter, blocks[0]);
  assert(rs.size() == 2);
  assert(rs[0].label_text == "<<<<<<< (Current)");
  assert(rs[1].label_text == "Incoming (Incoming)");

  Section s{5, 6, 5, 6};
  ConflictBlock b;
  b.current = {0, 1, 1, 1};
  b.ancestor = s;
  b.incoming = {8, 9, 8, 8};
  auto ar = project_block(std::vector<std::string>{}, b);
  assert(ar.size() == 3);
  assert(ar[0].label_text == "Current (Current)");
  assert(ar[1].label_text == "Ancestor (Base)");
  assert(ar[2].label_text == "Incoming (Incoming)");
}

static void test_no_blocks() {
  std::vector<std::string> lines = {"just", "text"};
  assert(project_regions(lines, parse_conflicts(lines)).empty());
  assert(region_role(RegionKind::Ancestor) == "Base");
  assert(region_fallback(RegionKind::Ancestor) == "Ancestor");
}

int main() {
  test_two_way_regions();
  test_ancestor_region();
  test_fallback_label();
  test_no_blocks();
  return 0;
}
