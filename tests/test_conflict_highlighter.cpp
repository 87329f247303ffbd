#include "conflict_highlighter.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  std::vector<std::string> lines = {
    "intro",
    "<<<<<<< a", "x", "=======", "y", ">>>>>>> a",
    "middle",
    "<<<<<<< b", "p", "||||||| base", "q", "=======", "r", ">>>>>>> b",
  };
  ConflictHighlighter h;
  assert(h.enabled());
  h.refresh(lines);
  assert(h.blocks().size() == 2);
  assert(h.regions().size() == 5);

  assert(h.region_at(0) == nullptr);
  assert(h.region_at(2)->kind == RegionKind::Current);
  assert(h.region_at(3) == nullptr);
  assert(h.region_at(4)->kind == RegionKind::Incoming);
  assert(h.region_at(10)->kind == RegionKind::Ancestor);
  assert(h.label_at(1)->kind == RegionKind::Current);
  assert(h.label_at(5)->label_text == ">>>>>>> a (Incoming)");
  assert(h.label_at(10)->label_text == "q (Base)");
  assert(h.label_at(6) == nullptr);

  assert(h.next_conflict(0) == 1);
  assert(h.next_conflict(1) == 7);
  assert(!h.next_conflict(7));
  assert(h.prev_conflict(13) == 7);
  assert(h.prev_conflict(7) == 1);
  assert(!h.prev_conflict(1));

  // full recomputation: resolving a conflict drops its regions
  std::vector<std::string> resolved = {"intro", "x", "middle"};
  h.refresh(resolved);
  assert(h.blocks().empty());
  assert(h.regions().empty());

  h.refresh(lines);
  h.clear();
  assert(h.regions().empty());

  h.set_enabled(false);
  h.refresh(lines);
  assert(h.blocks().empty());
  h.set_enabled(true);
  h.refresh(lines);
  assert(h.blocks().size() == 2);
  return 0;
}
