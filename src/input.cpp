#include "input.hpp"

bool Input::is_prefix_key(int ch) {
  return ch == 'd' || ch == 'g' || ch == ']' || ch == '[';
}

int Input::take_pending() {
  int p = pending_;
  pending_ = 0;
  return p;
}

bool Input::consume_digit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    return true;
  }
  if (ch == '0' && pending_count_ > 0) {
    pending_count_ = pending_count_ * 10;
    return true;
  }
  return false;
}

size_t Input::take_count() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_ = 0;
  pending_count_ = 0;
}
