#pragma once
/*
 * MarkerMatcher
 *
 * Purpose: classify a single line as one of the conflict marker prefixes.
 * Markers: "%%%%%%" header, "<<<<<<<" start, "|||||||" ancestor,
 *          "=======" middle, ">>>>>>>" finish. Only the line prefix counts.
 */
#include <string_view>

enum class MarkerKind { None, Header, Start, Ancestor, Middle, Finish };

bool is_marker(std::string_view line, MarkerKind kind);

// first match in priority order: header, start, ancestor, middle, finish
MarkerKind classify_marker(std::string_view line);

std::string_view marker_prefix(MarkerKind kind);
