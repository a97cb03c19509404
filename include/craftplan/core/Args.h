#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace craftplan::core {

// Tiny, dependency-free argument parser for the craftplan command line.
//
// Supports:
//  - Flags:         --flag   -h   -hv
//  - KV args:       --key value   --key=value   -k value (with setArity)   -k=value
//  - Aliases:       setAlias("r", "recipes") makes -r behave like --recipes
//  - Positional:    everything else, and everything after "--"
//
// Repeated keys accumulate; last() returns the most recent value, values() all of them.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  // Configure an option to consume `valueCount` subsequent values.
  void setArity(std::string_view key, int valueCount) {
    if (valueCount <= 0) return;
    arity_[std::string(key)] = valueCount;
  }

  // Make `alias` (usually a single letter) store under `key`.
  void setAlias(std::string_view alias, std::string_view key) {
    if (alias.empty() || key.empty()) return;
    aliases_[std::string(alias)] = std::string(key);
  }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a == "--") {
        for (int j = i + 1; j < argc; ++j) {
          if (argv[j]) positional_.push_back(std::string(argv[j]));
        }
        break;
      }

      if (startsWith(a, "--")) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[resolve(a.substr(2, eq - 2))].push_back(a.substr(eq + 1));
          continue;
        }
        i = takeValues(resolve(a.substr(2)), i, argc, argv, 1);
        continue;
      }

      if (a.size() >= 2 && a[0] == '-') {
        const auto eq = a.find('=');
        if (eq == 2) {
          kv_[resolve(a.substr(1, 1))].push_back(a.substr(eq + 1));
          continue;
        }

        if (a.size() == 2) {
          const std::string key = resolve(a.substr(1, 1));
          if (arity_.count(key) != 0) {
            i = takeValues(key, i, argc, argv, 0);
            continue;
          }
        }

        // Grouped short flags (-hv).
        for (std::size_t j = 1; j < a.size(); ++j) {
          flags_.push_back(resolve(std::string(1, a[j])));
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    if (hasFlag(key)) return true;
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

  const std::vector<std::string>& flags() const { return flags_; }
  const std::vector<std::string>& positional() const { return positional_; }

private:
  static bool startsWith(const std::string& s, const char* prefix) {
    const std::size_t n = std::char_traits<char>::length(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
  }

  // "-" alone is a stdin/stdout placeholder, not a switch.
  static bool isSwitch(const char* s) {
    return s && s[0] == '-' && s[1] != '\0';
  }

  std::string resolve(const std::string& key) const {
    const auto it = aliases_.find(key);
    return (it != aliases_.end()) ? it->second : key;
  }

  // Consume up to arity(key) values following argv[i]. With no values the option
  // becomes a flag. Returns the index of the last consumed argument.
  int takeValues(const std::string& key, int i, int argc, char** argv, int defaultArity) {
    const auto ar = arity_.find(key);
    const int need = (ar != arity_.end()) ? ar->second : defaultArity;

    int took = 0;
    while (took < need && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
      kv_[key].push_back(std::string(argv[++i]));
      ++took;
    }
    if (took == 0) flags_.push_back(key);
    return i;
  }

  std::string program_;
  std::unordered_map<std::string, int> arity_;
  std::unordered_map<std::string, std::string> aliases_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace craftplan::core
