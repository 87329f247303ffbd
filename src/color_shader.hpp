#pragma once
/*
 * ColorShader
 *
 * Purpose: integer color math on packed 24-bit RGB (R<<16 | G<<8 | B).
 * shade_color darkens every channel to floor(c * (100 - amount) / 100).
 */
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using PackedColor = std::uint32_t;

struct Rgb { int r = 0; int g = 0; int b = 0; };

Rgb split_color(PackedColor color);
PackedColor join_color(Rgb rgb);

// amount is clamped to [0, 100]; bits above 24 are ignored
PackedColor shade_color(PackedColor color, int amount_percent);

std::string format_color(PackedColor color);                 // "#rrggbb"
std::optional<PackedColor> parse_color(std::string_view text); // "#rrggbb" or "0xRRGGBB"
