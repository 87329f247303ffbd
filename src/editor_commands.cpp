#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <filesystem>

// empty args toggle, otherwise on|off (also 1|0, true|false)
static std::optional<bool> parse_switch(const std::vector<std::string>& args, bool current) {
  if (args.empty()) return !current;
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") return true;
  if (v == "off" || v == "0" || v == "false") return false;
  return std::nullopt;
}

static std::optional<int> parse_int(const std::string& s) {
  if (s.empty() || s.size() > 9) return std::nullopt;
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return std::nullopt;
  return std::stoi(s);
}

std::string Editor::write_to(const std::optional<std::filesystem::path>& target, bool quit_after) {
  if (!target) return "don't have path, use :w <path>";
  std::string mm;
  if (!buf.write_file(*target, mm)) return mm;
  if (!file_path) file_path = *target;
  modified_ = false;
  if (quit_after) should_quit = true;
  // BufWritePost
  conflicts.refresh(buf.lines());
  return mm;
}

void Editor::register_commands() {
  registry.register_command("w", [this](const std::vector<std::string>& args) {
    if (!args.empty()) return write_to(std::filesystem::path(args[0]), false);
    return write_to(file_path, false);
  });
  registry.register_command("wq", [this](const std::vector<std::string>& args) {
    if (!args.empty()) return write_to(std::filesystem::path(args[0]), true);
    if (!file_path && !modified_) { should_quit = true; return std::string("no path and no changes, quit"); }
    return write_to(file_path, true);
  });
  registry.register_command("q", [this](const std::vector<std::string>&) {
    if (modified_) return std::string("have unsaved changes, use :q! or :w");
    should_quit = true;
    return std::string();
  });
  registry.register_command("q!", [this](const std::vector<std::string>&) {
    should_quit = true;
    return std::string();
  });
  registry.register_command("set number", [this](const std::vector<std::string>& args) {
    auto v = parse_switch(args, show_line_numbers);
    if (!v) return std::string("set number: use :set number on|off");
    show_line_numbers = *v;
    return std::string(show_line_numbers ? "number on" : "number off");
  });
  registry.register_command("set conflict", [this](const std::vector<std::string>& args) {
    auto v = parse_switch(args, conflicts.enabled());
    if (!v) return std::string("set conflict: use :set conflict on|off");
    conflicts.set_enabled(*v);
    conflicts.refresh(buf.lines());
    return std::string(*v ? "conflict highlight on" : "conflict highlight off");
  });
  registry.register_command("set labelshade", [this](const std::vector<std::string>& args) {
    if (args.empty()) return "labelshade=" + std::to_string(label_shade);
    auto v = parse_int(args[0]);
    if (!v || *v > 100) return std::string("set labelshade: value must be 0..100");
    label_shade = *v;
    apply_theme();
    return "labelshade=" + std::to_string(label_shade);
  });
  registry.register_command("set conflictgroup", [this](const std::vector<std::string>& args) {
    if (args.size() != 2) return std::string("set conflictgroup: use :set conflictgroup current|incoming|ancestor <group>");
    RegionKind kind;
    if (args[0] == "current") kind = RegionKind::Current;
    else if (args[0] == "incoming") kind = RegionKind::Incoming;
    else if (args[0] == "ancestor") kind = RegionKind::Ancestor;
    else return "set conflictgroup: unknown side " + args[0];
    groups.for_kind(kind) = args[1];
    apply_theme();
    return args[0] + " group=" + args[1];
  });
  registry.register_command("hi", [this](const std::vector<std::string>& args) {
    if (args.empty()) return std::string("hi: use :hi <group> <#rrggbb|none>");
    const std::string& group = args[0];
    if (args.size() == 1) {
      auto c = hl_table.lookup(group);
      return group + " " + (c ? format_color(*c) : std::string("cleared"));
    }
    if (args[1] == "none" || args[1] == "NONE") {
      hl_table.erase(group);
      apply_theme();
      return group + " cleared";
    }
    auto c = parse_color(args[1]);
    if (!c) return "hi: invalid color " + args[1];
    hl_table.set(group, *c);
    apply_theme();
    return group + " " + format_color(*c);
  });
  registry.register_command("ConflictClear", [this](const std::vector<std::string>&) {
    conflicts.set_enabled(false);
    return std::string("conflict highlight cleared");
  });
  registry.register_command("ConflictRefresh", [this](const std::vector<std::string>&) {
    conflicts.set_enabled(true);
    conflicts.refresh(buf.lines());
    return std::to_string(conflicts.blocks().size()) + " conflict(s)";
  });
  registry.register_command("conflicts", [this](const std::vector<std::string>&) {
    conflicts.refresh(buf.lines());
    if (!conflicts.enabled()) return std::string("conflict highlight off");
    return std::to_string(conflicts.blocks().size()) + " conflict(s)";
  });
}
