#include "highlight_table.hpp"
#include <cassert>

int main() {
  HighlightTable t;
  assert(!t.lookup("DiffText"));
  assert(!t.lookup(""));

  // nothing resolved: fixed defaults, labels darkened by 60%
  ConflictGroups groups;
  ConflictTheme th = resolve_conflict_theme(t, groups);
  assert(th.current.body == 0x405D7E);
  assert(th.incoming.body == 0x314753);
  assert(th.ancestor.body == 0x68217A);
  assert(th.current.label == 0x192532);
  assert(th.for_kind(RegionKind::Ancestor).label == shade_color(0x68217A, 60));

  t.set("DiffAdd", 0x00FF00);
  t.set("Mine", 0x102030);
  assert(t.lookup("DiffAdd") == 0x00FF00u);
  assert(t.size() == 2);
  groups.for_kind(RegionKind::Current) = "Mine";
  th = resolve_conflict_theme(t, groups, 50);
  assert(th.current.body == 0x102030);
  assert(th.current.label == 0x081018);
  assert(th.incoming.body == 0x00FF00);
  assert(th.incoming.label == 0x007F00);
  assert(th.ancestor.body == 0x68217A);

  // group names are case-sensitive
  assert(!t.lookup("diffadd"));
  assert(t.erase("DiffAdd"));
  assert(!t.erase("DiffAdd"));
  th = resolve_conflict_theme(t, groups, 0);
  assert(th.incoming.body == default_region_color(RegionKind::Incoming));
  assert(th.incoming.label == th.incoming.body);

  t.set("Wide", 0xAB123456);
  assert(t.lookup("Wide") == 0x123456u);
  return 0;
}
