#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace craftplan::core {

// Settings ("CVars") shared by the command line and the shell. Every value is text.
// A variable may carry a validator; rejected values never reach the variable or its
// listeners.

struct CVar;

using CVarListener = std::function<void(const CVar&)>;
using CVarValidator = std::function<bool(std::string_view value, std::string* outError)>;

struct CVar {
  std::string name;
  std::string help;
  std::string value;
  std::string defaultValue;

  CVarValidator validate;
  std::vector<CVarListener> listeners;
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Redefining keeps the current value if the (new) validator accepts it, otherwise the
  // value falls back to the default. Returns nullptr when the default itself is rejected.
  CVar* define(std::string_view name, std::string defaultValue, std::string_view help = {},
               CVarValidator validate = {});

  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  // `value` is trimmed and may be quoted with "..." or '...'.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Name-sorted. A non-empty filter keeps names containing it (case-insensitive).
  std::vector<const CVar*> list(std::string_view filter = {}) const;

  // One assignment per line, `#` and `//` start comments:
  //   recipes.default_method = "Crafting Table"
  //   log.level debug
  //
  // Every line is tried. Returns false with one "path:line: reason" per failed line.
  bool loadFile(const std::string& path, std::string* outError = nullptr);

private:
  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
};

// Process-wide registry used by the CLI and the shell.
CVarRegistry& cvars();

inline constexpr const char* kCVarLogLevel = "log.level";
inline constexpr const char* kCVarDefaultMethod = "recipes.default_method";
inline constexpr const char* kCVarShellPrompt = "shell.prompt";

// Define log.level (drives setLogLevel), recipes.default_method and shell.prompt on cvars().
// Safe to call multiple times.
void installDefaultCVars();

} // namespace craftplan::core
