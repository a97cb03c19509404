#pragma once

#include "craftplan/plan/Calculator.h"
#include "craftplan/plan/Recipe.h"
#include "craftplan/plan/Stack.h"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace craftplan::io {

// Plain-text recipe files.
//
//   Oak Wood Planks (4): Oak Log (1)
//
//   Charcoal (1) (Furnace): Oak Log (1)
//
//   Wooden Shovel (1):
//       Oak Wood Planks (1)
//       Stick (2)
//
// A header names the result stack and an optional method, followed by either one
// ingredient on the same line or one indented ingredient per line. Blank lines separate
// blocks. Counts may use '_' as a digit separator (1_000).

struct RecipeParseResult {
  // Every recipe parsed before the first error, in file order.
  std::vector<plan::Recipe> recipes;

  bool ok{true};
  std::string error;
  std::size_t errorLine{0}; // 1-based; 0 when ok
};

RecipeParseResult parseRecipes(std::string_view text, std::string_view defaultMethod);

// Digits with optional '_' separators; the first character must be a digit.
bool parseCount(std::string_view text, plan::Count& out, std::string* outError = nullptr);

// "<item> (<count>)" with optional surrounding whitespace.
bool parseStack(std::string_view text, plan::Stack& out, std::string* outError = nullptr);

// Header plus one indented line per ingredient, all counts multiplied by `repeats`.
// Pseudo-recipes come out as a bare header.
void writeRecipe(std::ostream& os, const plan::Recipe& recipe, plan::Count repeats = 1);
std::string formatRecipe(const plan::Recipe& recipe, plan::Count repeats = 1);

// Blocks separated by a blank line; the output parses back with parseRecipes().
void writeRecipes(std::ostream& os, const std::vector<const plan::Recipe*>& recipes);
std::string formatRecipes(const std::vector<const plan::Recipe*>& recipes);

// One block per step, scaled by the step's repeats.
void writeSteps(std::ostream& os, const std::vector<plan::PlanStep>& steps);
std::string formatSteps(const std::vector<plan::PlanStep>& steps);

// One "item (count)" line per stack.
void writeStacks(std::ostream& os, const std::vector<plan::Stack>& stacks);

} // namespace craftplan::io
