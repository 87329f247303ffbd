#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: track Normal mode two-key sequences (dd/gg/]x/[x) and count
 *          prefixes with minimal state.
 * Extend: decoupled from concrete editing actions; Editor interprets keys.
 */

class Input {
public:
  static bool is_prefix_key(int ch);
  void set_pending(int ch) { pending_ = ch; }
  // returns the pending prefix key (0 when none) and clears it
  int take_pending();
  bool consume_digit(int ch);
  bool has_count() const { return pending_count_ > 0; }
  size_t take_count();
  void reset();
private:
  int pending_ = 0;
  size_t pending_count_ = 0;
};
