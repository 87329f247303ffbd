#include "editor.hpp"
#include "ncurses_terminal.hpp"
#include <optional>
#include <filesystem>

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  NcursesTerminal term;
  Editor ed(term, path);
  if (auto rc = Editor::default_rc_path()) ed.load_rc(*rc);
  ed.run();
  return 0;
}
