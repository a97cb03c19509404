#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace craftplan::shell {

class Shell;

struct CommandDesc {
  // Word typed at the prompt. Any prefix of it selects the command.
  std::string name;

  // Usage shown in the help table, e.g. "target [stack]".
  std::string example;

  // One line for the help table.
  std::string shortHelp;

  // Shown by "help <name>". Falls back to shortHelp when empty.
  std::string longHelp;
};

struct CommandBinding {
  CommandDesc desc;

  // Receives the rest of the line, trimmed.
  std::function<void(std::string_view args, Shell& shell)> apply{};
};

// Ordered set of shell commands. Registration order decides prefix matching and the
// order of the help table.
class CommandRegistry {
 public:
  CommandRegistry() = default;

  // Add or replace a binding by name. Returns nullptr for an empty name or a binding
  // without a callback.
  CommandBinding* add(CommandBinding b);

  // Exact name lookup (linear scan; the registry is small).
  CommandBinding* find(std::string_view name);
  const CommandBinding* find(std::string_view name) const;

  // First registered command whose name starts with `word`.
  const CommandBinding* match(std::string_view word) const;

  const std::vector<CommandBinding>& items() const { return items_; }

  // "<example>   <shortHelp>" per command, examples padded to the widest one.
  void writeHelp(std::ostream& os) const;

  // Long help for `name`, or the help table when the name is unknown.
  void writeHelp(std::ostream& os, std::string_view name) const;

 private:
  std::vector<CommandBinding> items_;
};

} // namespace craftplan::shell
