#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch Ex commands.
 * Design: map name → handler (args vector → status message); Editor parses
 *         the command line, "set <opt>" is registered as one composite name.
 */
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<std::string(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has(const std::string& name) const { return map_.count(name) > 0; }
  // std::nullopt when the command is unknown
  std::optional<std::string> execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return std::nullopt;
    return it->second(args);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
