#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

int main() {
  assert(Renderer::pad_label("abc", 6) == "abc   ");
  assert(Renderer::pad_label("abcdef", 4) == "abcdef ");
  assert(Renderer::pad_label("x", 0).size() == 21);

  HeadlessTerminal term(10, 80);
  Renderer r;
  ConflictTheme theme = resolve_conflict_theme(HighlightTable{}, ConflictGroups{});
  r.apply_theme(term, theme);
  assert(term.pair_colors(Renderer::kCurrentPair)->second == 0x405D7E);
  assert(term.pair_colors(Renderer::kCurrentLabelPair)->second == 0x192532);
  assert(term.pair_colors(Renderer::kAncestorLabelPair)->first == ITerminal::kDefaultColor);

  TextBuffer buf;
  buf.init_from_lines({"a", "<<<<<<< ours", "x", "=======", "y", ">>>>>>> theirs", "b"});
  ConflictHighlighter h;
  h.refresh(buf.lines());
  Viewport vp;
  RenderInfo info;
  info.buf = &buf;
  info.vp = &vp;
  info.conflicts = &h;
  info.message = "hello";
  r.render(term, info);

  assert(term.row_text(0) == "a");
  assert(term.pair_at(0, 0) == ITerminal::kDefaultPair);
  // label overlays the opening marker and spans the full width
  assert(term.row_text(1) == "<<<<<<< ours (Current)");
  assert(term.pair_at(1, 0) == Renderer::kCurrentLabelPair);
  assert(term.pair_at(1, 79) == Renderer::kCurrentLabelPair);
  // body rows are filled to the right edge
  assert(term.row_text(2) == "x");
  assert(term.pair_at(2, 0) == Renderer::kCurrentPair);
  assert(term.pair_at(2, 79) == Renderer::kCurrentPair);
  assert(term.row_text(3) == "=======");
  assert(term.pair_at(3, 0) == ITerminal::kDefaultPair);
  assert(term.pair_at(4, 10) == Renderer::kIncomingPair);
  assert(term.row_text(5) == ">>>>>>> theirs (Incoming)");
  assert(term.pair_at(5, 0) == Renderer::kIncomingLabelPair);
  assert(term.pair_at(6, 0) == ITerminal::kDefaultPair);

  std::string status = term.row_text(9);
  assert(status.find("NORMAL") == 0);
  assert(status.find("[no file]") != std::string::npos);
  assert(status.find("conflicts:1") != std::string::npos);
  assert(status.find("| hello") != std::string::npos);
  assert(term.cursor() == std::make_pair(0, 0));
  assert(term.refresh_count() == 1);

  // line numbers shift text right; label starts after the gutter
  info.show_line_numbers = true;
  info.mode = Mode::Command;
  info.cmdline = "w";
  r.render(term, info);
  assert(term.row_text(0) == "1 a");
  assert(term.pair_at(1, 2) == Renderer::kCurrentLabelPair);
  assert(term.row_text(9) == ":w");

  // cleared highlighter paints nothing
  h.clear();
  info.mode = Mode::Normal;
  r.render(term, info);
  assert(term.pair_at(2, 2) == ITerminal::kDefaultPair);
  assert(term.row_text(1) == "2 <<<<<<< ours");
  return 0;
}
