#include "craftplan/core/Args.h"
#include "craftplan/core/CVar.h"
#include "craftplan/io/RecipeText.h"
#include "craftplan/shell/Shell.h"

#include <iostream>
#include <string>
#include <utility>

using namespace craftplan;

static void printHelp() {
  std::cout << "craftplan\n"
            << "  -r, --recipes <file>   Load recipes from a file (repeatable)\n"
            << "  --config <file>        Load settings (name = value lines) before anything else\n"
            << "  --log-level <lvl>      trace | debug | info | warn | error | off (default: warn)\n"
            << "  --target \"<stack>\"     Print the plan for e.g. \"Wooden Shovel (1)\" and exit\n"
            << "  -h, --help             Show this help\n"
            << "\n"
            << "Without --target an interactive shell runs on stdin; type `help` there.\n";
}

int main(int argc, char** argv) {
  core::Args args;
  args.setAlias("r", "recipes");
  args.setArity("recipes", 1);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  core::installDefaultCVars();
  core::CVarRegistry& reg = core::cvars();

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!reg.loadFile(configPath, &err)) {
      std::cerr << err;
      return 1;
    }
  }

  std::string level;
  if (args.getString("log-level", level)) {
    // Through the CVar so `set` in the shell shows the effective level.
    std::string err;
    if (!reg.setFromString(core::kCVarLogLevel, level, &err)) {
      std::cerr << "Invalid --log-level: " << err << "\n";
      return 1;
    }
  }

  shell::Shell sh(std::cin, std::cout, std::cerr);

  bool ok = true;
  for (const std::string& file : args.values("recipes")) {
    ok = sh.loadFile(file) && ok;
  }

  std::string targetText;
  if (!args.getString("target", targetText)) {
    sh.run();
    return (ok && !sh.failed()) ? 0 : 1;
  }

  if (!ok) return 1;

  plan::Stack target;
  std::string err;
  if (!io::parseStack(targetText, target, &err)) {
    std::cerr << "Invalid --target: " << err << "\n";
    return 1;
  }
  if (!sh.report(sh.calculator().setTarget(std::move(target)))) return 1;

  io::writeSteps(std::cout, sh.calculator().steps());
  return std::cout ? 0 : 1;
}
