#define NCURSES_NOMACROS
#include "ncurses_terminal.hpp"
#include <ncurses.h>
#include <algorithm>
#include <clocale>
#include <cstdlib>

NcursesTerminal::NcursesTerminal() {
  std::setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  if (has_colors()) {
    start_color();
    use_default_colors();
    colors_ = true;
  }
}

NcursesTerminal::~NcursesTerminal() {
  endwin();
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { werase(stdscr); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (colors_) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), static_cast<int>(text.size()));
  if (colors_) attroff(COLOR_PAIR(color_pair_id));
}

static int channel_distance(Rgb a, Rgb b) {
  int dr = a.r - b.r, dg = a.g - b.g, db = a.b - b.b;
  return dr * dr + dg * dg + db * db;
}

short NcursesTerminal::nearest_xterm256(PackedColor c) {
  static constexpr int levels[6] = {0, 95, 135, 175, 215, 255};
  auto cube_index = [](int v) {
    int best = 0;
    for (int i = 1; i < 6; ++i) {
      if (std::abs(levels[i] - v) < std::abs(levels[best] - v)) best = i;
    }
    return best;
  };
  Rgb in = split_color(c);
  int ri = cube_index(in.r), gi = cube_index(in.g), bi = cube_index(in.b);
  Rgb cube{levels[ri], levels[gi], levels[bi]};
  short cube_id = static_cast<short>(16 + 36 * ri + 6 * gi + bi);
  // grayscale ramp 232..255 covers 8..238 in steps of 10
  int avg = (in.r + in.g + in.b) / 3;
  int gray_step = std::clamp((avg - 8 + 5) / 10, 0, 23);
  int gv = 8 + 10 * gray_step;
  Rgb gray{gv, gv, gv};
  if (channel_distance(in, gray) < channel_distance(in, cube)) return static_cast<short>(232 + gray_step);
  return cube_id;
}

short NcursesTerminal::nearest_basic8(PackedColor c) {
  static constexpr short ids[8] = {COLOR_BLACK, COLOR_RED, COLOR_GREEN, COLOR_YELLOW,
                                   COLOR_BLUE, COLOR_MAGENTA, COLOR_CYAN, COLOR_WHITE};
  Rgb in = split_color(c);
  short best = COLOR_BLACK;
  int best_d = -1;
  for (short id : ids) {
    Rgb ref{(id & 1) ? 205 : 0, (id & 2) ? 205 : 0, (id & 4) ? 205 : 0};
    int d = channel_distance(in, ref);
    if (best_d < 0 || d < best_d) { best_d = d; best = id; }
  }
  return best;
}

short NcursesTerminal::color_slot(PackedColor c) {
  if (c == kDefaultColor) return -1;
  c &= 0xFFFFFFu;
  if (auto it = slots_.find(c); it != slots_.end()) return it->second;
  short slot;
  if (can_change_color() && COLORS > 16 && next_slot_ < COLORS) {
    slot = next_slot_++;
    Rgb in = split_color(c);
    // ncurses wants 0..1000 per channel
    init_color(slot, static_cast<short>(in.r * 1000 / 255),
               static_cast<short>(in.g * 1000 / 255),
               static_cast<short>(in.b * 1000 / 255));
  } else if (COLORS >= 256) {
    slot = nearest_xterm256(c);
  } else {
    slot = nearest_basic8(c);
  }
  slots_[c] = slot;
  return slot;
}

bool NcursesTerminal::define_pair(int color_pair_id, PackedColor fg, PackedColor bg) {
  if (!colors_ || color_pair_id <= kDefaultPair || color_pair_id >= COLOR_PAIRS) return false;
  return init_pair(static_cast<short>(color_pair_id), color_slot(fg), color_slot(bg)) == OK;
}

void NcursesTerminal::move_cursor(int row, int col) { wmove(stdscr, row, col); }

void NcursesTerminal::refresh() { wrefresh(stdscr); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  wmove(stdscr, row, col);
  wclrtoeol(stdscr);
}

void NcursesTerminal::fill_to_eol(int row, int col, int color_pair_id) {
  int rem = std::max(0, get_size().cols - col);
  if (rem == 0) return;
  draw_colored(row, col, std::string(static_cast<size_t>(rem), ' '), color_pair_id);
}

std::optional<int> NcursesTerminal::read_key() {
  int ch = wgetch(stdscr);
  switch (ch) {
    case ERR: return std::nullopt;
    case KEY_UP: return kKeyUp;
    case KEY_DOWN: return kKeyDown;
    case KEY_LEFT: return kKeyLeft;
    case KEY_RIGHT: return kKeyRight;
    case KEY_HOME: return kKeyHome;
    case KEY_END: return kKeyEnd;
    case KEY_NPAGE: return kKeyPageDown;
    case KEY_PPAGE: return kKeyPageUp;
    case KEY_BACKSPACE: return kKeyBackspace;
    case KEY_DC: return kKeyDelete;
    case KEY_ENTER: return kKeyEnter;
    case KEY_RESIZE: return kKeyResize;
    default: return ch;
  }
}
