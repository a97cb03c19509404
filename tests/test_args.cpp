#include "craftplan/core/Args.h"

#include <iostream>
#include <string>
#include <vector>

static std::vector<char*> makeArgv(std::initializer_list<const char*> items) {
  std::vector<char*> argv;
  argv.reserve(items.size());
  for (const char* s : items) {
    argv.push_back(const_cast<char*>(s));
  }
  return argv;
}

int test_args() {
  int fails = 0;

  using craftplan::core::Args;

  // Repeated recipe files accumulate in order, through both spellings.
  {
    auto argv = makeArgv({"craftplan", "-r", "a.txt", "--recipes", "b.txt", "--recipes=c.txt"});
    Args args;
    args.setAlias("r", "recipes");
    args.setArity("recipes", 1);
    args.parse((int)argv.size(), argv.data());

    const auto files = args.values("recipes");
    if (files.size() != 3 || files[0] != "a.txt" || files[1] != "b.txt" || files[2] != "c.txt") {
      std::cerr << "[test_args] expected -r/--recipes to collect 3 files, got size=" << files.size() << "\n";
      ++fails;
    }
    if (args.hasFlag("r")) {
      std::cerr << "[test_args] expected -r to be stored under its alias\n";
      ++fails;
    }
  }

  // A --target value keeps its spaces and parentheses.
  {
    auto argv = makeArgv({"craftplan", "--target", "Wooden Shovel (1)"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    std::string target;
    if (!args.getString("target", target) || target != "Wooden Shovel (1)") {
      std::cerr << "[test_args] expected --target to keep 'Wooden Shovel (1)'\n";
      ++fails;
    }
  }

  // The end-of-options marker should force everything after it to be positional.
  {
    auto argv = makeArgv({"craftplan", "--flag", "--", "--notAFlag", "-x", "pos"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("flag")) {
      std::cerr << "[test_args] expected --flag to be recognized\n";
      ++fails;
    }
    if (args.hasFlag("notAFlag") || args.hasFlag("x")) {
      std::cerr << "[test_args] expected tokens after -- to NOT be parsed as flags\n";
      ++fails;
    }
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "--notAFlag" || pos[1] != "-x" || pos[2] != "pos") {
      std::cerr << "[test_args] expected 3 positional args after --, got size=" << pos.size() << "\n";
      ++fails;
    }
  }

  // A lone '-' is a value, not a switch.
  {
    auto argv = makeArgv({"craftplan", "--config", "-"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (args.hasFlag("config")) {
      std::cerr << "[test_args] expected --config - to be parsed as a key/value, not a flag\n";
      ++fails;
    }
    const auto v = args.last("config");
    if (!v || *v != "-") {
      std::cerr << "[test_args] expected --config to have value '-'\n";
      ++fails;
    }
  }

  // A long option followed by another switch becomes a flag.
  {
    auto argv = makeArgv({"craftplan", "--help", "--log-level", "debug"});
    Args args;
    args.parse((int)argv.size(), argv.data());

    if (!args.hasFlag("help")) {
      std::cerr << "[test_args] expected --help to be a flag\n";
      ++fails;
    }
    const auto v = args.last("log-level");
    if (!v || *v != "debug") {
      std::cerr << "[test_args] expected --log-level debug\n";
      ++fails;
    }
  }

  // -k=value works without configuring an arity.
  {
    auto argv = makeArgv({"craftplan", "-r=-"});
    Args args;
    args.setAlias("r", "recipes");
    args.parse((int)argv.size(), argv.data());

    const auto v = args.last("recipes");
    if (!v || *v != "-") {
      std::cerr << "[test_args] expected -r=- to parse value '-' under 'recipes'\n";
      ++fails;
    }
  }

  // Short flag parsing should still work.
  {
    auto argv = makeArgv({"craftplan", "-hv"});
    Args args;
    args.parse((int)argv.size(), argv.data());
    if (!args.hasFlag("h") || !args.hasFlag("v")) {
      std::cerr << "[test_args] expected -hv to set flags h and v\n";
      ++fails;
    }
    if (args.program() != "craftplan") {
      std::cerr << "[test_args] expected program name 'craftplan'\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_args] pass\n";
  return fails;
}
