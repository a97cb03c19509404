#include "craftplan/core/CVar.h"

#include "craftplan/core/Log.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace craftplan::core {

static std::string_view trimView(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = (char)std::tolower((unsigned char)c);
  return out;
}

// Drops one pair of surrounding quotes; inside them \" \' \\ \n \t are escapes.
static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() < 2 || (s.front() != '"' && s.front() != '\'') || s.back() != s.front()) {
    return std::string(s);
  }
  s = s.substr(1, s.size() - 2);

  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 == s.size()) {
      out.push_back(s[i]);
      continue;
    }
    const char n = s[++i];
    switch (n) {
      case 'n': out.push_back('\n'); break;
      case 't': out.push_back('\t'); break;
      case '"':
      case '\'':
      case '\\': out.push_back(n); break;
      default:
        out.push_back('\\');
        out.push_back(n);
        break;
    }
  }
  return out;
}

// Cuts a trailing "# ..." or "// ..." comment outside quotes. Quotes open only at the start
// of a token ("O'Reilly" is a bare word) and "//" only after whitespace (URLs survive).
static std::string_view stripComment(std::string_view s) {
  char quote = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    const bool tokenStart = (i == 0) || std::isspace((unsigned char)s[i - 1]) || s[i - 1] == '=';
    if (quote) {
      if (c == '\\') ++i;
      else if (c == quote) quote = 0;
    } else if ((c == '"' || c == '\'') && tokenStart) {
      quote = c;
    } else if (c == '#') {
      return s.substr(0, i);
    } else if (c == '/' && i + 1 < s.size() && s[i + 1] == '/' &&
               (i == 0 || std::isspace((unsigned char)s[i - 1]))) {
      return s.substr(0, i);
    }
  }
  return s;
}

static bool accepts(const CVar& v, std::string_view value, std::string* outError) {
  if (!v.validate) return true;
  std::string why;
  if (v.validate(value, &why)) return true;
  if (outError) *outError = v.name + ": " + why;
  return false;
}

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

CVar* CVarRegistry::define(std::string_view name, std::string defaultValue, std::string_view help,
                           CVarValidator validate) {
  std::lock_guard<std::mutex> lock(mutex_);

  CVar candidate;
  candidate.name = std::string(name);
  candidate.validate = validate;
  std::string err;
  if (name.empty() || !accepts(candidate, defaultValue, &err)) {
    CRAFTPLAN_LOG_ERROR("cvar '" + std::string(name) + "': bad definition " + err);
    return nullptr;
  }

  auto it = vars_.find(name);
  if (it == vars_.end()) {
    CVar v;
    v.name = std::string(name);
    v.value = defaultValue;
    it = vars_.emplace(v.name, std::move(v)).first;
  }

  CVar& v = it->second;
  if (!help.empty()) v.help = std::string(help);
  v.defaultValue = std::move(defaultValue);
  v.validate = std::move(validate);
  if (!accepts(v, v.value, nullptr)) v.value = v.defaultValue;
  return &v;
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? it->second.value : std::string(fallback);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  const std::string text = unquote(value);

  CVar snapshot;
  std::vector<CVarListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown variable: " + std::string(name);
      return false;
    }
    if (!accepts(it->second, text, outError)) return false;

    it->second.value = text;
    snapshot.name = it->second.name;
    snapshot.value = it->second.value;
    snapshot.defaultValue = it->second.defaultValue;
    listeners = it->second.listeners;
  }

  // Outside the lock so a listener may read or set other variables.
  for (const auto& cb : listeners) {
    if (cb) cb(snapshot);
  }
  return true;
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown variable: " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

std::vector<const CVar*> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = lowerAscii(filter);
  std::vector<const CVar*> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    if (needle.empty() || lowerAscii(kv.first).find(needle) != std::string::npos) {
      out.push_back(&kv.second);
    }
  }
  return out;
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Couldn't open config file \"" + path + "\"\n";
    return false;
  }

  std::ostringstream errs;
  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    const std::string_view sv = trimView(stripComment(line));
    if (sv.empty()) continue;

    // "name = value" or "name value".
    std::size_t split = sv.find('=');
    if (split == std::string_view::npos || trimView(sv.substr(0, split)).find_first_of(" \t") != std::string_view::npos) {
      split = sv.find_first_of(" \t");
    }
    const std::string_view name = trimView(sv.substr(0, split));
    const std::string_view value = (split == std::string_view::npos) ? std::string_view{} : trimView(sv.substr(split + 1));

    std::string err;
    if (!setFromString(name, value, &err)) {
      errs << path << ":" << lineNo << ": " << err << "\n";
    }
  }

  const std::string all = errs.str();
  if (!all.empty() && outError) *outError = all;
  return all.empty();
}

CVarRegistry& cvars() {
  static CVarRegistry g;
  return g;
}

static bool validLogLevel(std::string_view value, std::string* outError) {
  LogLevel lvl = LogLevel::Warn;
  if (parseLogLevel(value, lvl)) return true;
  if (outError) *outError = "expected trace|debug|info|warn|error|off, got '" + std::string(value) + "'";
  return false;
}

void installDefaultCVars() {
  static std::once_flag once;
  std::call_once(once, [] {
    CVarRegistry& r = cvars();

    std::string level;
    for (char c : toString(getLogLevel())) {
      if (c != ' ') level.push_back((char)std::tolower((unsigned char)c));
    }
    r.define(kCVarLogLevel, level, "Global log level: trace|debug|info|warn|error|off", validLogLevel);
    r.addListener(kCVarLogLevel, [](const CVar& cv) {
      LogLevel lvl = LogLevel::Warn;
      if (parseLogLevel(cv.value, lvl)) setLogLevel(lvl);
    });

    r.define(kCVarDefaultMethod, "Crafting Table", "Method label for recipes that do not name one");
    r.define(kCVarShellPrompt, "$ ", "Prompt printed by the interactive shell");
  });
}

} // namespace craftplan::core
