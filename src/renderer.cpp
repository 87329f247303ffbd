#include "renderer.hpp"
#include <algorithm>
#include <sstream>
#include "config.hpp"

int Renderer::body_pair(RegionKind kind) {
  switch (kind) {
    case RegionKind::Incoming: return kIncomingPair;
    case RegionKind::Ancestor: return kAncestorPair;
    case RegionKind::Current: break;
  }
  return kCurrentPair;
}

int Renderer::label_pair(RegionKind kind) {
  switch (kind) {
    case RegionKind::Incoming: return kIncomingLabelPair;
    case RegionKind::Ancestor: return kAncestorLabelPair;
    case RegionKind::Current: break;
  }
  return kCurrentLabelPair;
}

std::string Renderer::pad_label(const std::string& label, int width) {
  int remaining = width > 0 ? width - static_cast<int>(label.size()) : MC_LABEL_FALLBACK_PAD;
  if (remaining < 1) remaining = 1;
  return label + std::string(static_cast<size_t>(remaining), ' ');
}

void Renderer::apply_theme(ITerminal& term, const ConflictTheme& theme) {
  for (RegionKind k : {RegionKind::Current, RegionKind::Incoming, RegionKind::Ancestor}) {
    const RegionColors& c = theme.for_kind(k);
    term.define_pair(body_pair(k), ITerminal::kDefaultColor, c.body);
    term.define_pair(label_pair(k), ITerminal::kDefaultColor, c.label);
  }
}

static const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Insert: return "INSERT";
    case Mode::Command: return "COMMAND";
    case Mode::Normal: break;
  }
  return "NORMAL";
}

void Renderer::render(ITerminal& term, const RenderInfo& info) {
  const TextBuffer& buf = *info.buf;
  const Cursor& cur = info.cur;
  Viewport& vp = *info.vp;
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = std::max(0, rows - 1);
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (max_text_rows > 0 && cur.row >= vp.top_line + max_text_rows) vp.top_line = cur.row - max_text_rows + 1;
  int ln_width = 0;
  int indent = 0;
  if (info.show_line_numbers) {
    int digits = 1;
    int total = std::max(1, buf.line_count());
    while (total >= 10) { total /= 10; digits++; }
    ln_width = digits;
    indent = ln_width + 1;
  }
  int text_cols = std::max(0, cols - indent);
  if (text_cols <= 0) vp.left_col = 0;
  else {
    if (cur.col < vp.left_col) vp.left_col = cur.col;
    else if (cur.col >= vp.left_col + text_cols) vp.left_col = cur.col - text_cols + 1;
    if (vp.left_col < 0) vp.left_col = 0;
  }

  for (int i = 0; i < max_text_rows; ++i) {
    int line_idx = vp.top_line + i;
    if (line_idx >= buf.line_count()) break;
    const std::string s = buf.line(line_idx);
    int s_len = static_cast<int>(s.size());
    int start_col = std::min(vp.left_col, s_len);
    int end_col = std::min(s_len, start_col + text_cols);
    std::string vis = s.substr(static_cast<size_t>(start_col), static_cast<size_t>(end_col - start_col));
    if (info.show_line_numbers) {
      std::string num = std::to_string(line_idx + 1);
      std::string pad(static_cast<size_t>(std::max(0, ln_width - static_cast<int>(num.size()))), ' ');
      term.draw_text(i, 0, pad + num + " ");
    }
    const RegionDescriptor* label = info.conflicts ? info.conflicts->label_at(line_idx) : nullptr;
    const RegionDescriptor* body = info.conflicts ? info.conflicts->region_at(line_idx) : nullptr;
    if (label) {
      // overlay: the label hides the marker line underneath
      std::string text = pad_label(label->label_text, text_cols);
      if (static_cast<int>(text.size()) > text_cols) text.resize(static_cast<size_t>(text_cols));
      term.draw_colored(i, indent, text, label_pair(label->kind));
    } else if (body) {
      int pair = body_pair(body->kind);
      term.draw_colored(i, indent, vis, pair);
      term.fill_to_eol(i, indent + static_cast<int>(vis.size()), pair);
    } else {
      term.draw_text(i, indent, vis);
      term.clear_to_eol(i, indent + static_cast<int>(vis.size()));
    }
  }

  std::string status;
  if (info.mode == Mode::Command) {
    status = ":" + info.cmdline;
  } else {
    std::ostringstream oss;
    oss << mode_name(info.mode) << "  "
        << (info.file_path ? info.file_path->string() : "[no file]")
        << (info.modified ? " [+]" : "")
        << "  row:" << (cur.row + 1) << " col:" << (cur.col + 1);
    if (info.conflicts && info.conflicts->enabled()) oss << "  conflicts:" << info.conflicts->blocks().size();
    if (!info.message.empty()) oss << "  | " << info.message;
    status = oss.str();
  }
  if (rows > 0) {
    term.draw_text(rows - 1, 0, status.substr(0, static_cast<size_t>(std::max(0, cols))));
    term.clear_to_eol(rows - 1, static_cast<int>(std::min<size_t>(status.size(), static_cast<size_t>(std::max(0, cols)))));
  }

  int screen_row = cur.row - vp.top_line;
  if (info.mode == Mode::Command) {
    term.move_cursor(rows - 1, std::min(cols - 1, 1 + static_cast<int>(info.cmdline.size())));
  } else if (screen_row >= 0 && screen_row < max_text_rows) {
    int want_col = std::min(cur.col, static_cast<int>(buf.line(cur.row).size()));
    int screen_col = indent + std::max(0, want_col - vp.left_col);
    screen_col = std::min(screen_col, cols - 1);
    term.move_cursor(screen_row, screen_col);
  } else {
    term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}
