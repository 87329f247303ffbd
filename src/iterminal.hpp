#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, colors, cursor, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Colors: define_pair binds a pair id to packed RGB colors; kDefaultColor
 *         keeps the terminal's own foreground/background.
 */
#include <optional>
#include <string>
#include "color_shader.hpp"

struct TermSize { int rows; int cols; };

// backend-neutral key codes returned by read_key besides plain bytes
enum : int {
  kKeyEsc = 27,
  kKeyBackspace = 0x1000,
  kKeyDelete,
  kKeyEnter,
  kKeyUp,
  kKeyDown,
  kKeyLeft,
  kKeyRight,
  kKeyHome,
  kKeyEnd,
  kKeyPageUp,
  kKeyPageDown,
  kKeyResize,
};

class ITerminal {
public:
  static constexpr PackedColor kDefaultColor = 0xFFFFFFFFu;
  // pair 0 is the terminal default and cannot be redefined
  static constexpr int kDefaultPair = 0;

  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual bool define_pair(int color_pair_id, PackedColor fg, PackedColor bg) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // fill from col to the right edge with spaces in the given pair
  virtual void fill_to_eol(int row, int col, int color_pair_id) = 0;
  // std::nullopt when no more input will arrive
  virtual std::optional<int> read_key() = 0;
};
