#include "craftplan/io/RecipeText.h"

#include "test_harness.h"

#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace craftplan;

int test_recipe_text() {
  int failures = 0;

  // ---- Single-line recipes, with and without a method ----
  {
    const auto res = io::parseRecipes("Oak Wood Planks (4): Oak Log (1)\n"
                                      "Charcoal (1) (Furnace): Oak Log (1)\n",
                                      "Crafting Table");
    CHECK(res.ok);
    CHECK(res.recipes.size() == 2);
    if (res.recipes.size() == 2) {
      CHECK(res.recipes[0] ==
            plan::Recipe(plan::Stack("Oak Wood Planks", 4), "Crafting Table", {plan::Stack("Oak Log", 1)}));
      CHECK(res.recipes[1] == plan::Recipe(plan::Stack("Charcoal", 1), "Furnace", {plan::Stack("Oak Log", 1)}));
    }
  }

  // ---- Indented ingredients, CRLF, blank runs, no final newline ----
  {
    const auto res = io::parseRecipes("\n"
                                      "Wooden Shovel (1):\n"
                                      " Oak Wood Planks (1)\n"
                                      "\tStick (2)\n"
                                      "\n"
                                      "\n"
                                      "Stick (1_000) (Crafting Table):\r\n"
                                      "    Oak Wood Planks (500)",
                                      "Hand");
    CHECK(res.ok);
    CHECK(res.recipes.size() == 2);
    if (res.recipes.size() == 2) {
      const plan::Recipe& shovel = res.recipes[0];
      CHECK(shovel.result() == plan::Stack("Wooden Shovel", 1));
      CHECK(shovel.method() == "Hand");
      CHECK(shovel.ingredients() ==
            (std::vector<plan::Stack>{plan::Stack("Oak Wood Planks", 1), plan::Stack("Stick", 2)}));

      CHECK(res.recipes[1].result() == plan::Stack("Stick", 1000));
      CHECK(res.recipes[1].method() == "Crafting Table");
      CHECK(res.recipes[1].ingredients() == std::vector<plan::Stack>{plan::Stack("Oak Wood Planks", 500)});
    }
  }

  // ---- A header alone declares a recipe without ingredients ----
  {
    const auto res = io::parseRecipes("Water Bucket (1) (Well):\n\nStick (4): Oak Wood Planks (2)\n", "Hand");
    CHECK(res.ok);
    CHECK(res.recipes.size() == 2);
    if (res.recipes.size() == 2) {
      CHECK(res.recipes[0].ingredients().empty());
      CHECK(res.recipes[0].method() == "Well");
      CHECK(res.recipes[1].method() == "Hand");
    }
  }

  // ---- Errors carry the line and keep the recipes before it ----
  {
    const auto colon = io::parseRecipes("Stick (4): Oak Wood Planks (2)\n\nTorch (4) Stick (1)\n", "Hand");
    CHECK(!colon.ok);
    CHECK(colon.errorLine == 3);
    CHECK(colon.recipes.size() == 1);
    CHECK(!colon.error.empty());

    const auto badCount = io::parseRecipes("Torch (4):\n    Stick (one)\n", "Hand");
    CHECK(!badCount.ok);
    CHECK(badCount.errorLine == 2);
    CHECK(badCount.recipes.empty());

    const auto tooBig = io::parseRecipes("Dust (18446744073709551616): Rock (1)\n", "Hand");
    CHECK(!tooBig.ok);
    CHECK(tooBig.errorLine == 1);

    const auto glued = io::parseRecipes("Torch (4):Stick (1)\n", "Hand");
    CHECK(!glued.ok);
    CHECK(glued.errorLine == 1);

    CHECK(!io::parseRecipes("Torch (4) (): Stick (1)\n", "Hand").ok);
  }

  // ---- Counts ----
  {
    plan::Count n = 0;
    CHECK(io::parseCount("0", n));
    CHECK(n == 0);
    CHECK(io::parseCount("1_000_000", n));
    CHECK(n == 1000000);
    CHECK(io::parseCount("18446744073709551615", n));
    CHECK(n == std::numeric_limits<plan::Count>::max());

    // Rejections leave the output alone.
    std::string err;
    CHECK(!io::parseCount("_1", n, &err));
    CHECK(!io::parseCount("", n, &err));
    CHECK(!io::parseCount("12a", n, &err));
    CHECK(!io::parseCount("18446744073709551616", n, &err));
    CHECK(!err.empty());
    CHECK(n == std::numeric_limits<plan::Count>::max());
  }

  // ---- Single stacks ----
  {
    plan::Stack s;
    std::string err;
    CHECK(io::parseStack("  Wooden Shovel (1)  ", s));
    CHECK(s == plan::Stack("Wooden Shovel", 1));
    CHECK(!io::parseStack("Wooden Shovel", s, &err));
    CHECK(!io::parseStack("(3)", s, &err));
    CHECK(!io::parseStack("Stick (3", s, &err));
    CHECK(!io::parseStack("Stick (3) extra", s, &err));
    CHECK(s == plan::Stack("Wooden Shovel", 1));
  }

  // ---- Formatting scales counts and reads back ----
  {
    const plan::Recipe shovel(plan::Stack("Wooden Shovel", 1), "Crafting Table",
                              {plan::Stack("Oak Wood Planks", 1), plan::Stack("Stick", 2)});
    CHECK(io::formatRecipe(shovel) ==
          "Wooden Shovel (1) (Crafting Table):\n"
          "    Oak Wood Planks (1)\n"
          "    Stick (2)\n");
    CHECK(io::formatRecipe(shovel, 3) ==
          "Wooden Shovel (3) (Crafting Table):\n"
          "    Oak Wood Planks (3)\n"
          "    Stick (6)\n");
    CHECK(io::formatRecipe(plan::Recipe::rawMaterial("Oak Log"), 5) == "Oak Log (5) (Raw Material):\n");

    const plan::Recipe planks(plan::Stack("Oak Wood Planks", 4), "Crafting Table", {plan::Stack("Oak Log", 1)});
    const std::string text = io::formatRecipes({&planks, &shovel});
    CHECK(text ==
          "Oak Wood Planks (4) (Crafting Table):\n"
          "    Oak Log (1)\n"
          "\n"
          "Wooden Shovel (1) (Crafting Table):\n"
          "    Oak Wood Planks (1)\n"
          "    Stick (2)\n");

    const auto back = io::parseRecipes(text, "Hand");
    CHECK(back.ok);
    CHECK(back.recipes.size() == 2);
    if (back.recipes.size() == 2) {
      CHECK(back.recipes[0] == planks);
      CHECK(back.recipes[1] == shovel);
    }

    const std::vector<plan::PlanStep> steps = {
      {std::make_shared<const plan::Recipe>(plan::Recipe::rawMaterial("Oak Log")), 1},
      {std::make_shared<const plan::Recipe>(planks), 1},
    };
    CHECK(io::formatSteps(steps) ==
          "Oak Log (1) (Raw Material):\n"
          "Oak Wood Planks (4) (Crafting Table):\n"
          "    Oak Log (1)\n");
  }

  return failures;
}
