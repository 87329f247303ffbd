#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Lifetime: RAII session; constructor runs initscr/raw/noecho/keypad,
 *           destructor restores the terminal with endwin.
 * Colors: packed RGB is mapped to redefined color slots when the terminal
 *         supports can_change_color, else to the xterm-256 cube, else to
 *         the nearest of the 8 basic colors.
 * Note: <ncurses.h> stays out of this header; its clear()/refresh()/move()
 *       macros would collide with the ITerminal method names.
 */
#include "iterminal.hpp"
#include <unordered_map>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  NcursesTerminal(const NcursesTerminal&) = delete;
  NcursesTerminal& operator=(const NcursesTerminal&) = delete;

  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  bool define_pair(int color_pair_id, PackedColor fg, PackedColor bg) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  void fill_to_eol(int row, int col, int color_pair_id) override;
  std::optional<int> read_key() override;

  // nearest palette index for a packed color (exposed for tests)
  static short nearest_xterm256(PackedColor c);
  static short nearest_basic8(PackedColor c);

private:
  short color_slot(PackedColor c);
  bool colors_ = false;
  short next_slot_ = 16;
  std::unordered_map<PackedColor, short> slots_;
};
