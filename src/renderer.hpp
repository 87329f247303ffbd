#pragma once
/*
 * Renderer
 *
 * Purpose: render text, conflict regions/labels, status/command line and
 *          manage viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from Editor to render.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "conflict_highlighter.hpp"
#include "highlight_table.hpp"
#include "iterminal.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

struct RenderInfo {
  const TextBuffer* buf = nullptr;
  Cursor cur{};
  Viewport* vp = nullptr;
  Mode mode = Mode::Normal;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  std::string message;
  std::string cmdline;
  bool show_line_numbers = false;
  const ConflictHighlighter* conflicts = nullptr;
};

class Renderer {
public:
  // color pair ids owned by the renderer
  static constexpr int kCurrentPair = 1;
  static constexpr int kIncomingPair = 2;
  static constexpr int kAncestorPair = 3;
  static constexpr int kCurrentLabelPair = 4;
  static constexpr int kIncomingLabelPair = 5;
  static constexpr int kAncestorLabelPair = 6;

  static int body_pair(RegionKind kind);
  static int label_pair(RegionKind kind);

  // label followed by spaces up to width (at least one space)
  static std::string pad_label(const std::string& label, int width);

  void apply_theme(ITerminal& term, const ConflictTheme& theme);
  void render(ITerminal& term, const RenderInfo& info);
};
