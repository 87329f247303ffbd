#pragma once
/*
 * Editor
 *
 * Purpose: input loop around one TextBuffer with live conflict highlighting.
 * Change notification: buffer load, write and every edit call
 *        reparse_and_render(); each redraw re-parses as well, so the painted
 *        regions never outlive the text they were computed from.
 * Config: Ex commands (:set/:hi/...) at runtime or from an rc file.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "conflict_highlighter.hpp"
#include "highlight_table.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

class Editor {
public:
  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file);
  void run();

  void handle_input(int ch);
  // run one Ex command line (without the leading ':')
  void execute(const std::string& cmdline);
  // returns false (and sets the status message) when the file can't be read
  bool load_rc(const std::filesystem::path& path);
  void reparse_and_render();

  static std::optional<std::filesystem::path> default_rc_path();

  const TextBuffer& buffer() const { return buf; }
  const ConflictHighlighter& highlighter() const { return conflicts; }
  const ConflictTheme& theme() const { return current_theme; }
  const std::string& status_message() const { return message; }
  Cursor cursor() const { return cur; }
  Mode mode() const { return mode_; }
  bool modified() const { return modified_; }
  bool quit_requested() const { return should_quit; }

private:
  ITerminal& term;
  TextBuffer buf;
  std::optional<std::filesystem::path> file_path;
  bool modified_ = false;
  Cursor cur;
  Viewport vp;
  Mode mode_ = Mode::Normal;
  std::string message;
  std::string cmdline;
  bool show_line_numbers = false;
  bool should_quit = false;
  Input input;
  Renderer renderer;
  CommandRegistry registry;
  HighlightTable hl_table;
  ConflictGroups groups;
  int label_shade = MC_DEFAULT_LABEL_SHADE;
  ConflictTheme current_theme;
  ConflictHighlighter conflicts;

  void render();
  void apply_theme();
  void notify_changed();
  void register_commands();
  void handle_normal_input(int ch);
  void handle_insert_input(int ch);
  void handle_command_input(int ch);
  void clamp_cursor();
  int max_col_for_row(int row) const;
  void move_left();
  void move_right();
  void move_up();
  void move_down();
  void delete_char();
  void delete_lines(int count);
  void insert_char(int ch);
  void split_line_at_cursor();
  void backspace();
  void open_line(bool below);
  void jump_to_conflict(bool forward);
  std::string write_to(const std::optional<std::filesystem::path>& target, bool quit_after);
};
