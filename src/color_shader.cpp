#include "color_shader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

Rgb split_color(PackedColor color) {
  return { static_cast<int>((color >> 16) & 0xFF),
           static_cast<int>((color >> 8) & 0xFF),
           static_cast<int>(color & 0xFF) };
}

PackedColor join_color(Rgb rgb) {
  auto ch = [](int c) { return static_cast<PackedColor>(std::clamp(c, 0, 255)); };
  return (ch(rgb.r) << 16) | (ch(rgb.g) << 8) | ch(rgb.b);
}

PackedColor shade_color(PackedColor color, int amount_percent) {
  int keep = 100 - std::clamp(amount_percent, 0, 100);
  auto s = [keep](int c) {
    int v = c * keep / 100; // non-negative operands: truncation is floor
    return v < 0 ? 0 : v;
  };
  Rgb in = split_color(color);
  return join_color({ s(in.r), s(in.g), s(in.b) });
}

std::string format_color(PackedColor color) {
  char out[8];
  std::snprintf(out, sizeof(out), "#%06x", static_cast<unsigned>(color & 0xFFFFFFu));
  return std::string(out);
}

std::optional<PackedColor> parse_color(std::string_view text) {
  if (!text.empty() && text[0] == '#') text.remove_prefix(1);
  else if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) text.remove_prefix(2);
  else return std::nullopt;
  if (text.size() != 6) return std::nullopt;
  PackedColor v = 0;
  for (char c : text) {
    unsigned char u = static_cast<unsigned char>(c);
    if (!std::isxdigit(u)) return std::nullopt;
    int d = std::isdigit(u) ? (u - '0') : (std::tolower(u) - 'a' + 10);
    v = (v << 4) | static_cast<PackedColor>(d);
  }
  return v;
}
