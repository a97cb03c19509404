#include "craftplan/shell/CommandRegistry.h"

#include <algorithm>
#include <cctype>
#include <ostream>

namespace craftplan::shell {

static std::string trimAscii(std::string_view s) {
  std::size_t a = 0;
  while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
  std::size_t b = s.size();
  while (b > a && std::isspace((unsigned char)s[b - 1])) --b;
  return std::string(s.substr(a, b - a));
}

CommandBinding* CommandRegistry::add(CommandBinding b) {
  b.desc.name = trimAscii(b.desc.name);
  if (b.desc.name.empty() || !b.apply) return nullptr;
  if (b.desc.example.empty()) b.desc.example = b.desc.name;

  for (auto& existing : items_) {
    if (existing.desc.name == b.desc.name) {
      existing = std::move(b);
      return &existing;
    }
  }

  items_.push_back(std::move(b));
  return &items_.back();
}

CommandBinding* CommandRegistry::find(std::string_view name) {
  for (auto& b : items_) {
    if (b.desc.name == name) return &b;
  }
  return nullptr;
}

const CommandBinding* CommandRegistry::find(std::string_view name) const {
  for (const auto& b : items_) {
    if (b.desc.name == name) return &b;
  }
  return nullptr;
}

const CommandBinding* CommandRegistry::match(std::string_view word) const {
  if (word.empty()) return nullptr;
  for (const auto& b : items_) {
    if (std::string_view(b.desc.name).substr(0, word.size()) == word) return &b;
  }
  return nullptr;
}

void CommandRegistry::writeHelp(std::ostream& os) const {
  std::size_t width = 0;
  for (const auto& b : items_) width = std::max(width, b.desc.example.size());

  for (const auto& b : items_) {
    os << b.desc.example << std::string(width - b.desc.example.size(), ' ') << "   "
       << b.desc.shortHelp << '\n';
  }
}

void CommandRegistry::writeHelp(std::ostream& os, std::string_view name) const {
  const CommandBinding* b = find(name);
  if (!b) {
    writeHelp(os);
    return;
  }
  os << (b->desc.longHelp.empty() ? b->desc.shortHelp : b->desc.longHelp) << '\n';
}

} // namespace craftplan::shell
