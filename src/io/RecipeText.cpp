#include "craftplan/io/RecipeText.h"

#include "craftplan/core/Assert.h"
#include "craftplan/core/Checked.h"

#include <cctype>
#include <ostream>
#include <sstream>

namespace craftplan::io {

namespace {

bool isSpace(char c) { return std::isspace((unsigned char)c) != 0; }

bool isBlank(std::string_view s) {
  for (char c : s) {
    if (!isSpace(c)) return false;
  }
  return true;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
  return s;
}

struct Line {
  std::string_view text;
  std::size_t number{0};
};

// Splits on '\n' (a trailing '\r' is dropped). A missing final line ending is fine.
std::vector<Line> splitLines(std::string_view text) {
  std::vector<Line> lines;
  std::size_t start = 0;
  std::size_t number = 1;
  while (start < text.size()) {
    const std::size_t nl = text.find('\n', start);
    std::string_view line = (nl == std::string_view::npos) ? text.substr(start) : text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back({line, number});
    if (nl == std::string_view::npos) break;
    start = nl + 1;
    ++number;
  }
  return lines;
}

// Parses "<item> (<count>)" at the start of `s`; `consumed` is the index after ')'.
bool parseStackPrefix(std::string_view s, plan::Stack& out, std::size_t& consumed, std::string* outError) {
  const std::size_t open = s.find('(');
  if (open == std::string_view::npos) {
    if (outError) *outError = "expected '(' after item name";
    return false;
  }
  const std::string_view name = trim(s.substr(0, open));
  if (name.empty()) {
    if (outError) *outError = "missing item name";
    return false;
  }
  const std::size_t close = s.find(')', open);
  if (close == std::string_view::npos) {
    if (outError) *outError = "missing ')' after count";
    return false;
  }

  plan::Count count = 0;
  if (!parseCount(s.substr(open + 1, close - open - 1), count, outError)) return false;

  out = plan::Stack(std::string(name), count);
  consumed = close + 1;
  return true;
}

// "<result> (<n>)[ (<method>)]:" and whatever follows the colon.
bool parseHeader(std::string_view line,
                 std::string_view defaultMethod,
                 plan::Stack& result,
                 std::string& method,
                 std::string_view& rest,
                 std::string* outError) {
  std::size_t consumed = 0;
  if (!parseStackPrefix(line, result, consumed, outError)) return false;
  rest = line.substr(consumed);

  method = std::string(defaultMethod);
  if (rest.size() >= 2 && rest[0] == ' ' && rest[1] == '(') {
    const std::size_t close = rest.find(')');
    if (close == std::string_view::npos) {
      if (outError) *outError = "missing ')' after method";
      return false;
    }
    if (close == 2) {
      if (outError) *outError = "empty method";
      return false;
    }
    method = std::string(rest.substr(2, close - 2));
    rest = rest.substr(close + 1);
  }

  if (rest.empty() || rest[0] != ':') {
    if (outError) *outError = "expected ':' after recipe header";
    return false;
  }
  rest.remove_prefix(1);
  return true;
}

plan::Count scaledCount(const plan::Stack& stack, plan::Count repeats) {
  plan::Count out = 0;
  CRAFTPLAN_ASSERT_MSG(core::checkedMul(stack.count(), repeats, out),
                       "scaled stack count overflows: " + plan::toString(stack));
  return out;
}

} // namespace

bool parseCount(std::string_view text, plan::Count& out, std::string* outError) {
  if (text.empty() || !std::isdigit((unsigned char)text.front())) {
    if (outError) *outError = "count must start with a digit: '" + std::string(text) + "'";
    return false;
  }

  plan::Count value = 0;
  for (char c : text) {
    if (c == '_') continue;
    if (!std::isdigit((unsigned char)c)) {
      if (outError) *outError = "invalid character in count: '" + std::string(text) + "'";
      return false;
    }
    if (!core::checkedMul<plan::Count>(value, 10, value) ||
        !core::checkedAdd<plan::Count>(value, static_cast<plan::Count>(c - '0'), value)) {
      if (outError) *outError = "count out of range: '" + std::string(text) + "'";
      return false;
    }
  }
  out = value;
  return true;
}

bool parseStack(std::string_view text, plan::Stack& out, std::string* outError) {
  const std::string_view s = trim(text);
  plan::Stack stack;
  std::size_t consumed = 0;
  if (!parseStackPrefix(s, stack, consumed, outError)) return false;
  if (consumed != s.size()) {
    if (outError) *outError = "unexpected text after stack: '" + std::string(s.substr(consumed)) + "'";
    return false;
  }
  out = std::move(stack);
  return true;
}

RecipeParseResult parseRecipes(std::string_view text, std::string_view defaultMethod) {
  RecipeParseResult res;
  const std::vector<Line> lines = splitLines(text);

  const auto failAt = [&](const Line& line, const std::string& error) {
    res.ok = false;
    res.error = error;
    res.errorLine = line.number;
  };

  std::size_t i = 0;
  while (i < lines.size()) {
    const Line& header = lines[i++];
    if (isBlank(header.text)) continue;

    plan::Stack result;
    std::string method;
    std::string_view rest;
    std::string err;
    if (!parseHeader(header.text, defaultMethod, result, method, rest, &err)) {
      failAt(header, err);
      return res;
    }

    std::vector<plan::Stack> ingredients;
    if (!isBlank(rest)) {
      // Single ingredient on the header line.
      if (!isSpace(rest.front())) {
        failAt(header, "expected ' ' after ':'");
        return res;
      }
      plan::Stack ingredient;
      if (!parseStack(rest, ingredient, &err)) {
        failAt(header, err);
        return res;
      }
      ingredients.push_back(std::move(ingredient));
    } else {
      while (i < lines.size() && !isBlank(lines[i].text) && isSpace(lines[i].text.front())) {
        plan::Stack ingredient;
        if (!parseStack(lines[i].text, ingredient, &err)) {
          failAt(lines[i], err);
          return res;
        }
        ingredients.push_back(std::move(ingredient));
        ++i;
      }
    }

    res.recipes.emplace_back(std::move(result), std::move(method), std::move(ingredients));
  }
  return res;
}

void writeRecipe(std::ostream& os, const plan::Recipe& recipe, plan::Count repeats) {
  const plan::Stack& result = recipe.result();
  os << result.item() << " (" << scaledCount(result, repeats) << ") (" << recipe.method() << "):\n";
  for (const plan::Stack& ingredient : recipe.ingredients()) {
    os << "    " << ingredient.item() << " (" << scaledCount(ingredient, repeats) << ")\n";
  }
}

std::string formatRecipe(const plan::Recipe& recipe, plan::Count repeats) {
  std::ostringstream oss;
  writeRecipe(oss, recipe, repeats);
  return oss.str();
}

void writeRecipes(std::ostream& os, const std::vector<const plan::Recipe*>& recipes) {
  bool first = true;
  for (const plan::Recipe* recipe : recipes) {
    if (!recipe) continue;
    if (!first) os << '\n';
    first = false;
    writeRecipe(os, *recipe);
  }
}

std::string formatRecipes(const std::vector<const plan::Recipe*>& recipes) {
  std::ostringstream oss;
  writeRecipes(oss, recipes);
  return oss.str();
}

void writeSteps(std::ostream& os, const std::vector<plan::PlanStep>& steps) {
  for (const plan::PlanStep& step : steps) {
    if (!step.recipe) continue;
    writeRecipe(os, *step.recipe, step.repeats);
  }
}

std::string formatSteps(const std::vector<plan::PlanStep>& steps) {
  std::ostringstream oss;
  writeSteps(oss, steps);
  return oss.str();
}

void writeStacks(std::ostream& os, const std::vector<plan::Stack>& stacks) {
  for (const plan::Stack& stack : stacks) os << stack << '\n';
}

} // namespace craftplan::io
