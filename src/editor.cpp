#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include "file_reader.hpp"

Editor::Editor(ITerminal& t, const std::optional<std::filesystem::path>& file) : term(t) {
  if (file) {
    bool ok = true;
    buf = TextBuffer::from_file(*file, message, ok);
    file_path = *file;
    // a missing file is a new file; keep the path for :w
    std::error_code ec;
    if (!ok && !std::filesystem::exists(*file, ec)) message = "new file: " + file->string();
  } else {
    buf.ensure_not_empty();
  }
  register_commands();
  apply_theme();
  conflicts.refresh(buf.lines());
}

std::optional<std::filesystem::path> Editor::default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / MC_RC_FILE_NAME;
}

bool Editor::load_rc(const std::filesystem::path& p) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return true;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(p, lines, msg)) { message = msg; return false; }
  for (std::string s : lines) {
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn(static_cast<unsigned char>(s[i]))) i++;
    size_t j = s.size(); while (j > i && isspace_fn(static_cast<unsigned char>(s[j - 1]))) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    execute(s);
  }
  return true;
}

void Editor::run() {
  while (!should_quit) {
    render();
    auto ch = term.read_key();
    if (!ch) break;
    handle_input(*ch);
  }
}

void Editor::apply_theme() {
  current_theme = resolve_conflict_theme(hl_table, groups, label_shade);
  renderer.apply_theme(term, current_theme);
}

void Editor::reparse_and_render() {
  conflicts.refresh(buf.lines());
  render();
}

void Editor::notify_changed() {
  modified_ = true;
  conflicts.refresh(buf.lines());
}

void Editor::render() {
  // redraws re-parse too; the buffer may have been swapped underneath
  conflicts.refresh(buf.lines());
  RenderInfo info;
  info.buf = &buf;
  info.cur = cur;
  info.vp = &vp;
  info.mode = mode_;
  info.file_path = file_path;
  info.modified = modified_;
  info.message = message;
  info.cmdline = cmdline;
  info.show_line_numbers = show_line_numbers;
  info.conflicts = &conflicts;
  renderer.render(term, info);
}

void Editor::handle_input(int ch) {
  if (ch == kKeyResize) return;
  switch (mode_) {
    case Mode::Command: handle_command_input(ch); break;
    case Mode::Insert: handle_insert_input(ch); break;
    case Mode::Normal: handle_normal_input(ch); break;
  }
}

void Editor::handle_normal_input(int ch) {
  int prefix = input.take_pending();
  if (prefix != 0) {
    size_t n = input.take_count(); if (n == 0) n = 1;
    if (prefix == 'd' && ch == 'd') delete_lines(static_cast<int>(n));
    else if (prefix == 'g' && ch == 'g') { cur.row = 0; clamp_cursor(); }
    else if (prefix == ']' && ch == 'x') jump_to_conflict(true);
    else if (prefix == '[' && ch == 'x') jump_to_conflict(false);
    return;
  }
  if (input.consume_digit(ch)) return;
  if (Input::is_prefix_key(ch)) { input.set_pending(ch); return; }
  size_t n = input.take_count(); if (n == 0) n = 1;
  switch (ch) {
    case 'h': case kKeyLeft: while (n--) move_left(); break;
    case 'j': case kKeyDown: while (n--) move_down(); break;
    case 'k': case kKeyUp: while (n--) move_up(); break;
    case 'l': case kKeyRight: while (n--) move_right(); break;
    case '0': case kKeyHome: cur.col = 0; break;
    case '$': case kKeyEnd: cur.col = max_col_for_row(cur.row); break;
    case 'G': cur.row = buf.line_count() - 1; clamp_cursor(); break;
    case 'x': case kKeyDelete: while (n--) delete_char(); break;
    case 'i': mode_ = Mode::Insert; break;
    case 'a':
      cur.col = std::min(static_cast<int>(buf.line(cur.row).size()), cur.col + 1);
      mode_ = Mode::Insert;
      break;
    case 'o': open_line(true); break;
    case 'O': open_line(false); break;
    case ':': mode_ = Mode::Command; cmdline.clear(); break;
    case kKeyEsc: input.reset(); break;
    default: break;
  }
}

void Editor::handle_insert_input(int ch) {
  switch (ch) {
    case kKeyEsc:
      mode_ = Mode::Normal;
      if (cur.col > 0) cur.col--;
      clamp_cursor();
      return;
    case kKeyBackspace: case 127: case 8: backspace(); return;
    case kKeyEnter: case '\n': case '\r': split_line_at_cursor(); return;
    case kKeyLeft: move_left(); return;
    case kKeyRight: move_right(); return;
    case kKeyUp: move_up(); return;
    case kKeyDown: move_down(); return;
    case kKeyDelete: delete_char(); return;
    default: break;
  }
  if ((ch >= 32 && ch <= 126) || ch == '\t') insert_char(ch);
}

void Editor::handle_command_input(int ch) {
  if (ch == kKeyEsc) { mode_ = Mode::Normal; cmdline.clear(); return; }
  if (ch == kKeyBackspace || ch == 127 || ch == 8) {
    if (cmdline.empty()) { mode_ = Mode::Normal; return; }
    cmdline.pop_back();
    return;
  }
  if (ch == '\n' || ch == '\r' || ch == kKeyEnter) {
    mode_ = Mode::Normal;
    std::string line = cmdline;
    cmdline.clear();
    execute(line);
    return;
  }
  if (ch >= 32 && ch <= 126) cmdline.push_back(static_cast<char>(ch));
}

void Editor::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  std::string name = cmd;
  if (cmd == "set" && !args.empty()) {
    // "set opt=value" and "set opt value" both route to "set opt"
    std::string opt = args.front();
    args.erase(args.begin());
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      args.insert(args.begin(), opt.substr(eq + 1));
      opt = opt.substr(0, eq);
    }
    name = "set " + opt;
  }
  auto result = registry.execute(name, args);
  message = result ? *result : "unknown command: " + name;
}

int Editor::max_col_for_row(int row) const {
  int len = static_cast<int>(buf.line(row).size());
  if (mode_ == Mode::Insert) return len;
  return std::max(0, len - 1);
}

void Editor::clamp_cursor() {
  cur.row = std::clamp(cur.row, 0, std::max(0, buf.line_count() - 1));
  cur.col = std::clamp(cur.col, 0, max_col_for_row(cur.row));
}

void Editor::move_left() { if (cur.col > 0) cur.col--; }
void Editor::move_right() { if (cur.col < max_col_for_row(cur.row)) cur.col++; }
void Editor::move_up() { if (cur.row > 0) { cur.row--; clamp_cursor(); } }
void Editor::move_down() { if (cur.row + 1 < buf.line_count()) { cur.row++; clamp_cursor(); } }

void Editor::delete_char() {
  std::string s = buf.line(cur.row);
  if (cur.col < 0 || cur.col >= static_cast<int>(s.size())) return;
  s.erase(static_cast<size_t>(cur.col), 1);
  buf.replace_line(cur.row, s);
  clamp_cursor();
  notify_changed();
}

void Editor::delete_lines(int count) {
  for (int i = 0; i < count && cur.row < buf.line_count(); ++i) {
    bool last = buf.line_count() == 1;
    buf.erase_line(cur.row);
    if (last) break;
    if (cur.row >= buf.line_count()) { cur.row = buf.line_count() - 1; break; }
  }
  cur.col = 0;
  clamp_cursor();
  notify_changed();
}

void Editor::insert_char(int ch) {
  std::string s = buf.line(cur.row);
  cur.col = std::clamp(cur.col, 0, static_cast<int>(s.size()));
  s.insert(s.begin() + cur.col, static_cast<char>(ch));
  buf.replace_line(cur.row, s);
  cur.col++;
  notify_changed();
}

void Editor::split_line_at_cursor() {
  std::string s = buf.line(cur.row);
  int c = std::clamp(cur.col, 0, static_cast<int>(s.size()));
  buf.replace_line(cur.row, s.substr(0, static_cast<size_t>(c)));
  buf.insert_line(cur.row + 1, s.substr(static_cast<size_t>(c)));
  cur.row++;
  cur.col = 0;
  notify_changed();
}

void Editor::backspace() {
  if (cur.col > 0) {
    std::string s = buf.line(cur.row);
    int c = std::min(cur.col, static_cast<int>(s.size()));
    if (c == 0) { cur.col = 0; return; }
    s.erase(static_cast<size_t>(c - 1), 1);
    buf.replace_line(cur.row, s);
    cur.col = c - 1;
    notify_changed();
    return;
  }
  if (cur.row == 0) return;
  // join with the previous line
  std::string prev = buf.line(cur.row - 1);
  std::string s = buf.line(cur.row);
  buf.replace_line(cur.row - 1, prev + s);
  buf.erase_line(cur.row);
  cur.row--;
  cur.col = static_cast<int>(prev.size());
  notify_changed();
}

void Editor::open_line(bool below) {
  int row = below ? cur.row + 1 : cur.row;
  buf.insert_line(row, std::string());
  cur.row = row;
  cur.col = 0;
  mode_ = Mode::Insert;
  notify_changed();
}

void Editor::jump_to_conflict(bool forward) {
  conflicts.refresh(buf.lines());
  auto target = forward ? conflicts.next_conflict(cur.row) : conflicts.prev_conflict(cur.row);
  if (!target) {
    message = forward ? "no next conflict" : "no previous conflict";
    return;
  }
  cur.row = *target;
  cur.col = 0;
  clamp_cursor();
}
