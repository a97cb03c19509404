#include "craftplan/core/CVar.h"
#include "craftplan/core/Log.h"

#include "test_harness.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <string_view>

using craftplan::core::CVar;
using craftplan::core::CVarRegistry;

namespace {

bool oneWord(std::string_view v, std::string* outError) {
  if (!v.empty() && v.find(' ') == std::string_view::npos) return true;
  if (outError) *outError = "expected one word";
  return false;
}

} // namespace

int test_cvars() {
  int failures = 0;

  // ---- Define, get, set ----
  {
    CVarRegistry r;
    CHECK(r.define("recipes.default_method", "Crafting Table", "method") != nullptr);
    CHECK(r.getString("recipes.default_method") == "Crafting Table");
    CHECK(r.getString("missing", "fallback") == "fallback");

    std::string err;
    CHECK(r.setFromString("recipes.default_method", "  Furnace  ", &err));
    CHECK(r.getString("recipes.default_method") == "Furnace");
    CHECK(r.setFromString("recipes.default_method", "\"Blast \\\"Hot\\\" Furnace\"", &err));
    CHECK(r.getString("recipes.default_method") == "Blast \"Hot\" Furnace");
    CHECK(r.setFromString("recipes.default_method", "'  padded  '", &err));
    CHECK(r.getString("recipes.default_method") == "  padded  ");

    CHECK(!r.setFromString("missing", "x", &err));
    CHECK(err == "Unknown variable: missing");
    CHECK(r.define("", "x") == nullptr);
  }

  // ---- Validators guard the value ----
  {
    CVarRegistry r;
    CHECK(r.define("w", "two words", {}, oneWord) == nullptr);
    CHECK(!r.exists("w"));

    CHECK(r.define("w", "one", "a word", oneWord) != nullptr);
    int calls = 0;
    CHECK(r.addListener("w", [&](const CVar&) { ++calls; }));

    std::string err;
    CHECK(!r.setFromString("w", "not one", &err));
    CHECK(err == "w: expected one word");
    CHECK(r.getString("w") == "one");
    CHECK(calls == 0);

    // Redefinition keeps a value the validator still accepts and drops one it doesn't.
    CHECK(r.setFromString("w", "two", &err));
    CHECK(r.define("w", "one", {}, oneWord) != nullptr);
    CHECK(r.getString("w") == "two");
    CHECK(r.define("w", "three", {}, [](std::string_view v, std::string*) { return v != "two"; }) != nullptr);
    CHECK(r.getString("w") == "three");
    CHECK(r.find("w") && r.find("w")->help == "a word");
  }

  // ---- Listing is name-sorted and filterable ----
  {
    CVarRegistry r;
    CHECK(r.define("shell.prompt", "> ") != nullptr);
    CHECK(r.define("log.level", "warn") != nullptr);
    CHECK(r.define("recipes.default_method", "Crafting Table") != nullptr);

    const auto all = r.list();
    CHECK(all.size() == 3);
    if (all.size() == 3) {
      CHECK(all[0]->name == "log.level");
      CHECK(all[1]->name == "recipes.default_method");
      CHECK(all[2]->name == "shell.prompt");
    }
    CHECK(r.list("RECIPES").size() == 1);
    CHECK(r.list("nothing").empty());
  }

  // ---- Listeners see the new value ----
  {
    CVarRegistry r;
    CHECK(r.define("shell.prompt", "$ ") != nullptr);
    std::string seen;
    CHECK(r.addListener("shell.prompt", [&](const CVar& v) { seen = v.value; }));
    CHECK(r.setFromString("shell.prompt", "\"> \""));
    CHECK(seen == "> ");
    CHECK(!r.addListener("missing", [](const CVar&) {}));
  }

  // ---- Config files ----
  {
    const std::string path = "craftplan_test_cvars.cfg";
    {
      std::ofstream f(path);
      f << "# craftplan settings\n";
      f << "\n";
      f << "a.method = \"Crafting # Table\" # trailing comment\n";
      f << "a.apos = O'Reilly # trailing comment\n";
      f << "a.url = http://example.com/a//b // trailing comment\n";
      f << "a.word mixed\n";
      f << "  // a whole-line comment\n";
      f << "a.prompt \"x = y\"\n";
      f << "nobody.knows = 1\n";
      f << "a.word = two words\n";
    }

    CVarRegistry r;
    CHECK(r.define("a.method", "") != nullptr);
    CHECK(r.define("a.apos", "") != nullptr);
    CHECK(r.define("a.url", "") != nullptr);
    CHECK(r.define("a.word", "start", {}, oneWord) != nullptr);
    CHECK(r.define("a.prompt", "") != nullptr);

    std::string err;
    CHECK(!r.loadFile(path, &err));
    CHECK(err.find(path + ":9: Unknown variable: nobody.knows") != std::string::npos);
    CHECK(err.find(path + ":10: a.word: expected one word") != std::string::npos);

    // The good lines are applied anyway.
    CHECK(r.getString("a.method") == "Crafting # Table");
    CHECK(r.getString("a.apos") == "O'Reilly");
    CHECK(r.getString("a.url") == "http://example.com/a//b");
    CHECK(r.getString("a.word") == "mixed");
    CHECK(r.getString("a.prompt") == "x = y");

    CHECK(!r.loadFile("craftplan_test_cvars_missing.cfg", &err));
    CHECK(err.find("craftplan_test_cvars_missing.cfg") != std::string::npos);

    std::remove(path.c_str());
  }

  // ---- Defaults installed for the application ----
  {
    using namespace craftplan::core;
    const LogLevel prev = getLogLevel();

    installDefaultCVars();
    installDefaultCVars();
    CHECK(cvars().getString(kCVarDefaultMethod, "") == "Crafting Table");
    CHECK(cvars().getString(kCVarShellPrompt, "") == "$ ");
    CHECK(cvars().exists(kCVarLogLevel));

    // log.level drives the logger and refuses unknown levels.
    std::string err;
    CHECK(cvars().setFromString(kCVarLogLevel, "error", &err));
    CHECK(getLogLevel() == LogLevel::Error);
    CHECK(!cvars().setFromString(kCVarLogLevel, "bogus", &err));
    CHECK(err.find("log.level") == 0);
    CHECK(cvars().getString(kCVarLogLevel) == "error");
    CHECK(getLogLevel() == LogLevel::Error);

    CHECK(cvars().setFromString(kCVarLogLevel, "warn", &err));
    setLogLevel(prev);
  }

  return failures;
}
