#include "craftplan/shell/Shell.h"

#include "craftplan/core/CVar.h"
#include "craftplan/core/Log.h"
#include "craftplan/io/RecipeText.h"

#include <cctype>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <utility>
#include <vector>

namespace craftplan::shell {

static std::string_view trimView(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static std::string defaultMethod() {
  return core::cvars().getString(core::kCVarDefaultMethod, "Crafting Table");
}

static bool isStateName(std::string_view what) {
  return what == "steps" || what == "resources" || what == "recipes";
}

// Writes one part of the calculator state. Returns false for an unknown `what`.
static bool writeState(std::ostream& os, const plan::Calculator& calc, std::string_view what) {
  if (what == "steps") {
    io::writeSteps(os, calc.steps());
  } else if (what == "resources") {
    io::writeStacks(os, calc.resources());
  } else if (what == "recipes") {
    io::writeRecipes(os, calc.recipes());
  } else {
    return false;
  }
  return true;
}

// Parses `text` as a stack or reports "Couldn't parse <what>: ...".
static bool parseStackArg(Shell& sh, std::string_view text, std::string_view what, plan::Stack& out) {
  std::string err;
  if (io::parseStack(text, out, &err)) return true;
  sh.fail() << "Couldn't parse " << what << ": " << err << '\n';
  return false;
}

static void cmdHelp(std::string_view args, Shell& sh) {
  if (args.empty()) {
    sh.commands().writeHelp(sh.out());
  } else {
    sh.commands().writeHelp(sh.out(), args);
  }
}

static void cmdLoad(std::string_view args, Shell& sh) {
  if (args.empty()) {
    sh.fail() << "Can't load recipes with no `file` argument.\n";
    return;
  }
  if (!sh.loadFile(std::string(args))) sh.markFailed();
}

static void cmdPrint(std::string_view args, Shell& sh) {
  const std::string_view what = args.empty() ? std::string_view("steps") : args;
  if (!writeState(sh.out(), sh.calculator(), what)) {
    sh.out() << "Unknown `what`: \"" << what << "\"\n";
  }
}

static void cmdRecipe(std::string_view, Shell& sh) {
  std::string line;
  if (!sh.prompt("Enter result (ex: Oak Planks (4))", line)) {
    sh.fail() << "Couldn't get result: end of input\n";
    return;
  }
  plan::Stack result;
  if (!parseStackArg(sh, line, "result", result)) return;

  std::string method;
  if (!sh.prompt("Enter crafting method", method)) {
    sh.fail() << "Couldn't get crafting method: end of input\n";
    return;
  }
  if (method.empty()) method = defaultMethod();

  std::vector<plan::Stack> ingredients;
  for (;;) {
    if (!sh.prompt("Enter ingredient (leave blank to finish)", line)) {
      sh.fail() << "Couldn't get ingredient: end of input\n";
      return;
    }
    if (line.empty()) break;
    plan::Stack ingredient;
    if (!parseStackArg(sh, line, "ingredient", ingredient)) return;
    ingredients.push_back(std::move(ingredient));
  }

  sh.report(sh.calculator().setRecipe(plan::Recipe(std::move(result), std::move(method), std::move(ingredients))));
}

static void cmdResource(std::string_view args, Shell& sh) {
  std::string line(args);
  if (line.empty() && !sh.prompt("Enter resource", line)) {
    sh.fail() << "Couldn't get resource: end of input\n";
    return;
  }
  plan::Stack resource;
  if (!parseStackArg(sh, line, "resource", resource)) return;
  sh.report(sh.calculator().addResource(resource));
}

static void cmdTarget(std::string_view args, Shell& sh) {
  if (args.empty()) {
    if (sh.calculator().hasTarget()) {
      sh.out() << "Current target is " << sh.calculator().target() << '\n';
    } else {
      sh.out() << "No target set\n";
    }
    return;
  }
  plan::Stack target;
  if (!parseStackArg(sh, args, "target", target)) return;
  sh.report(sh.calculator().setTarget(std::move(target)));
}

static void cmdWrite(std::string_view args, Shell& sh) {
  if (args.empty()) {
    sh.fail() << "Can't write state with no `file` argument.\n";
    return;
  }

  // "write <file> [what]": a trailing state name selects what to write.
  std::string path(args);
  std::string_view what = "recipes";
  const std::size_t sp = args.find_last_of(" \t");
  if (sp != std::string_view::npos && isStateName(args.substr(sp + 1))) {
    what = args.substr(sp + 1);
    path = std::string(trimView(args.substr(0, sp)));
  }

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    sh.fail() << "Couldn't open file for writing: \"" << path << "\"\n";
    return;
  }
  writeState(f, sh.calculator(), what);
  f.flush();
  if (!f) {
    sh.fail() << "Couldn't write " << what << " to \"" << path << "\"\n";
    return;
  }
  CRAFTPLAN_LOG_INFO("shell: wrote " + std::string(what) + " to " + path);
}

static void printCVar(std::ostream& os, const core::CVar& v) {
  os << v.name << " = \"" << v.value << "\"\n";
}

static void cmdSet(std::string_view args, Shell& sh) {
  core::CVarRegistry& reg = core::cvars();
  if (args.empty()) {
    for (const core::CVar* v : reg.list()) printCVar(sh.out(), *v);
    return;
  }

  const std::size_t sp = args.find_first_of(" \t");
  const std::string_view name = args.substr(0, sp);
  const std::string_view value = (sp == std::string_view::npos) ? std::string_view{} : trimView(args.substr(sp));

  if (value.empty()) {
    const core::CVar* v = reg.find(name);
    if (!v) {
      sh.fail() << "Unknown variable: " << name << '\n';
      return;
    }
    printCVar(sh.out(), *v);
    return;
  }

  std::string err;
  if (!reg.setFromString(name, value, &err)) sh.fail() << err << '\n';
}

Shell::Shell(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {
  core::installDefaultCVars();
  registerBuiltins();
}

void Shell::registerBuiltins() {
  commands_.add({{"help", "help [cmd]",
                  "Print this help message or print detailed help about `cmd`.",
                  "Print information about the available commands. Use `help cmd` to print help "
                  "about the command `cmd`."},
                 cmdHelp});
  commands_.add({{"load", "load <file>", "Read recipes from `file`.", ""}, cmdLoad});
  commands_.add({{"print", "print [what]", "Print the current state of the calculator.",
                  "Print the current state of the calculator.\n"
                  "`what` can be `steps`, `resources`, or `recipes`. "
                  "If `what` is omitted, it is assumed to be `steps`."},
                 cmdPrint});
  commands_.add({{"recipe", "recipe", "Add a new recipe to the calculator.",
                  "Asks for the result, the method and then one ingredient per line until a "
                  "blank line, and adds that recipe to the calculator."},
                 cmdRecipe});
  commands_.add({{"resource", "resource [stack]",
                  "Adds `stack` as a resource that is already available for crafting.",
                  "Adds `stack` as a resource that is already available and therefore does not "
                  "need to be crafted. Asks for the stack if it is omitted."},
                 cmdResource});
  commands_.add({{"target", "target [stack]",
                  "Sets the calculator to target `stack` or prints the current target.",
                  "If `stack` is given, the calculator's target is set to `stack`. Otherwise, "
                  "prints the calculator's current target."},
                 cmdTarget});
  commands_.add({{"write", "write <file> [what]",
                  "Similar to `print what` but writes to `file` and defaults to `recipes`.",
                  "Write the current state of the calculator to `file`.\n"
                  "`what` can be `steps`, `resources`, or `recipes`. "
                  "If `what` is omitted, it is assumed to be `recipes`."},
                 cmdWrite});
  commands_.add({{"set", "set [name [value]]", "List, print or change settings.",
                  "Without arguments, lists every setting. With `name`, prints that setting. "
                  "With `name value`, changes it."},
                 cmdSet});
}

void Shell::run() {
  std::string line;
  for (;;) {
    out_ << core::cvars().getString(core::kCVarShellPrompt, "$ ");
    out_.flush();
    if (!std::getline(in_, line)) {
      out_ << '\n';
      return;
    }
    execute(line);
  }
}

void Shell::execute(std::string_view line) {
  const std::string_view s = trimView(line);
  if (s.empty()) return;

  const std::size_t end = s.find_first_of(" \t");
  const std::string_view word = s.substr(0, end);
  const std::string_view args = (end == std::string_view::npos) ? std::string_view{} : trimView(s.substr(end));

  const CommandBinding* b = commands_.match(word);
  if (!b) {
    commands_.writeHelp(out_);
    return;
  }

  CRAFTPLAN_LOG_DEBUG("shell: " + b->desc.name + " '" + std::string(args) + "'");
  // Copy: a command may replace bindings while it runs.
  const auto apply = b->apply;
  apply(args, *this);
}

bool Shell::loadFile(const std::string& path) {
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f) {
    err_ << "Couldn't open file \"" << path << "\"\n";
    return false;
  }
  std::ostringstream text;
  text << f.rdbuf();
  if (f.bad()) {
    err_ << "Couldn't read recipe file \"" << path << "\"\n";
    return false;
  }

  io::RecipeParseResult parsed = io::parseRecipes(text.str(), defaultMethod());
  if (!parsed.ok) {
    err_ << "warning: " << path << ":" << parsed.errorLine << ": " << parsed.error
         << "; ignoring the rest of the file\n";
  }

  const std::size_t count = parsed.recipes.size();
  if (!report(calculator_.addRecipes(std::move(parsed.recipes)))) return false;

  CRAFTPLAN_LOG_INFO("shell: loaded " + std::to_string(count) + " recipes from " + path);
  return parsed.ok;
}

bool Shell::prompt(std::string_view label, std::string& line) {
  out_ << label << ": ";
  out_.flush();
  if (!std::getline(in_, line)) return false;
  line = std::string(trimView(line));
  return true;
}

bool Shell::report(const plan::CalcResult& result) {
  if (!result.ok) fail() << "error: " << plan::toString(result) << '\n';
  return result.ok;
}

} // namespace craftplan::shell
