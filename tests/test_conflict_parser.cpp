#include "conflict_parser.hpp"
#include <cassert>
#include <string>
#include <vector>

static void check_well_formed(const ConflictBlock& b) {
  assert(b.markers.start_line <= b.current.range_start);
  assert(b.markers.finish_line == b.incoming.range_end);
  assert(b.current.content_start <= b.current.content_end + 1);
  assert(b.current.content_end <= b.current.range_end);
  assert(b.incoming.content_end <= b.incoming.range_end);
  int last = b.current.content_end;
  if (b.ancestor) {
    assert(b.ancestor->content_start > last);
    assert(b.ancestor->content_end <= b.ancestor->range_end);
    last = b.ancestor->content_end;
    if (b.markers.middle_line) assert(b.ancestor->content_end < *b.markers.middle_line);
  }
  assert(b.incoming.content_start > last);
}

static void test_two_way() {
  std::vector<std::string> lines = {"a", "<<<<<<<", "x", "=======", "y", ">>>>>>>", "b"};
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  const auto& b = bs[0];
  check_well_formed(b);
  assert(b.current.range_start == 1);
  assert(b.current.content_start == 2);
  assert(b.current.content_end == 2);
  assert(b.current.range_end == 2);
  assert(b.incoming.range_start == 4);
  assert(b.incoming.content_start == 4);
  assert(b.incoming.content_end == 4);
  assert(b.incoming.range_end == 5);
  assert(!b.ancestor);
  assert(b.markers.start_line == 1);
  assert(b.markers.middle_line && *b.markers.middle_line == 3);
  assert(!b.markers.ancestor_line);
  assert(b.markers.finish_line == 5);
}

static void test_with_ancestor() {
  std::vector<std::string> lines = {"a", "<<<<<<<", "x", "|||||||", "base", "=======", "y", ">>>>>>>", "b"};
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  const auto& b = bs[0];
  check_well_formed(b);
  assert(b.current.content_start == 2);
  assert(b.current.content_end == 2);
  assert(b.ancestor);
  assert(b.ancestor->range_start == 4);
  assert(b.ancestor->content_start == 4);
  assert(b.ancestor->content_end == 4);
  assert(b.ancestor->range_end == 4);
  assert(b.markers.ancestor_line && *b.markers.ancestor_line == 3);
  assert(b.incoming.content_start == 6);
  assert(b.incoming.content_end == 6);
}

static void test_unterminated_terminates() {
  std::vector<std::string> lines = {"a", "<<<<<<<", "x", "=======", "y"};
  assert(parse_conflicts(lines).empty());
  std::vector<std::string> only_start = {"<<<<<<<"};
  assert(parse_conflicts(only_start).empty());
  std::vector<std::string> header_only = {"%%%%%% header", "text"};
  assert(parse_conflicts(header_only).empty());
}

static void test_complete_block_before_unterminated_one() {
  std::vector<std::string> lines = {"<<<<<<<", "x", "=======", "y", ">>>>>>>", "mid", "<<<<<<<", "dangling"};
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  assert(bs[0].markers.finish_line == 4);
}

static void test_no_markers() {
  std::vector<std::string> lines = {"int main() {", "  return 0;", "}", ""};
  assert(parse_conflicts(lines).empty());
  std::vector<std::string> none;
  assert(parse_conflicts(none).empty());
  // stray dividers outside a block are ignored
  std::vector<std::string> strays = {"=======", ">>>>>>>", "|||||||"};
  assert(parse_conflicts(strays).empty());
}

static void test_two_blocks_in_order() {
  std::vector<std::string> lines = {
    "<<<<<<< one", "a", "=======", "b", ">>>>>>> one",
    "between",
    "<<<<<<< two", "c", "|||||||", "base", "=======", "d", ">>>>>>> two",
  };
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 2);
  check_well_formed(bs[0]);
  check_well_formed(bs[1]);
  assert(bs[0].markers.start_line == 0);
  assert(bs[0].markers.finish_line == 4);
  assert(!bs[0].ancestor);
  assert(bs[1].markers.start_line == 6);
  assert(bs[1].markers.finish_line == 12);
  assert(bs[1].ancestor);
  assert(bs[0].markers.finish_line < bs[1].markers.start_line);
}

static void test_header_starts_block() {
  std::vector<std::string> lines = {
    "%%%%%% Conflict 1 of 1", "<<<<<<< side #1", "left", "=======", "right", ">>>>>>> end",
  };
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  const auto& b = bs[0];
  check_well_formed(b);
  assert(b.current.range_start == 0);
  // the nested start marker is ordinary content of the current side
  assert(b.current.content_start == 1);
  assert(b.current.content_end == 2);
  assert(b.incoming.content_start == 4);
}

static void test_missing_middle_fallback() {
  std::vector<std::string> lines = {"<<<<<<<", "x", "y", ">>>>>>>"};
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  const auto& b = bs[0];
  check_well_formed(b);
  assert(b.current.content_start == 1);
  assert(b.current.content_end == 2);
  assert(!b.markers.middle_line);
  assert(b.incoming.range_start == 3);
  assert(b.incoming.range_end == 3);
  assert(!b.incoming.has_content());
}

static void test_ancestor_without_middle() {
  std::vector<std::string> lines = {"<<<<<<<", "x", "|||||||", "base", ">>>>>>>"};
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  const auto& b = bs[0];
  check_well_formed(b);
  assert(b.current.content_end == 1);
  assert(b.ancestor);
  assert(b.ancestor->content_start == 3);
  assert(b.ancestor->content_end == 3);
  assert(!b.incoming.has_content());
  assert(b.incoming.range_start == 4);
}

static void test_only_first_divider_counts() {
  std::vector<std::string> lines = {
    "<<<<<<<", "x", "|||||||", "|||||||", "=======", "y", "=======", "z", ">>>>>>>",
  };
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  const auto& b = bs[0];
  check_well_formed(b);
  assert(*b.markers.ancestor_line == 2);
  assert(b.ancestor->content_start == 3);
  assert(b.ancestor->content_end == 3);
  assert(*b.markers.middle_line == 4);
  assert(b.incoming.content_start == 5);
  assert(b.incoming.content_end == 7);
  assert(b.incoming.content_size() == 3);
}

static void test_empty_sections() {
  std::vector<std::string> lines = {"<<<<<<<", "|||||||", "=======", ">>>>>>>"};
  auto bs = parse_conflicts(lines);
  assert(bs.size() == 1);
  const auto& b = bs[0];
  check_well_formed(b);
  assert(!b.current.has_content());
  assert(b.current.content_start == b.current.content_end + 1);
  assert(b.ancestor && !b.ancestor->has_content());
  assert(!b.incoming.has_content());
}

static void test_idempotent() {
  std::vector<std::string> lines = {
    "<<<<<<<", "x", "=======", "y", ">>>>>>>", "<<<<<<<", "x", "|||||||", "b", "=======", ">>>>>>>", "<<<<<<<",
  };
  auto first = parse_conflicts(lines);
  auto second = parse_conflicts(lines);
  assert(first == second);
  assert(first.size() == 2);
}

int main() {
  test_two_way();
  test_with_ancestor();
  test_unterminated_terminates();
  test_complete_block_before_unterminated_one();
  test_no_markers();
  test_two_blocks_in_order();
  test_header_starts_block();
  test_missing_middle_fallback();
  test_ancestor_without_middle();
  test_only_first_divider_counts();
  test_empty_sections();
  test_idempotent();
  return 0;
}
