#pragma once

#include "craftplan/plan/Recipe.h"
#include "craftplan/plan/Stack.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace craftplan::plan {

// One line of a plan: run `recipe` `repeats` times.
struct PlanStep {
  RecipePtr recipe;
  Count repeats{0};
};

struct CalcResult {
  bool ok{true};
  // Short machine-friendly reason on failure:
  //  - "invalid"   a recipe yields zero items
  //  - "overflow"  a count left the Count range
  //  - "cycle"     an item requires itself (detail names the path)
  //  - "internal"  an engine invariant did not hold
  const char* reason{nullptr};
  std::string detail;
};

// "ok" or "<reason>: <detail>"
std::string toString(const CalcResult& result);

using Catalog = std::unordered_map<std::string, RecipePtr>;
using ResourcePool = std::unordered_map<std::string, Count>;

// Computes the ordered plan that produces `target` from `catalog` and `resources`.
//
// Phase A walks the recipe graph breadth-first from the target, drawing on crafted
// surplus first, then on the resource pool, then crafting or marking raw materials.
// Phase B orders the resulting steps so that every ingredient is produced or drawn from
// storage before it is used, merging steps that produce the same item.
//
// `out` is replaced on success and left untouched on failure.
CalcResult computePlan(const Catalog& catalog,
                       const Stack& target,
                       const ResourcePool& resources,
                       std::vector<PlanStep>& out);

// The first recipe cycle reachable from `item`, formatted "A -> B -> A", or an empty
// string if the reachable part of the catalog is acyclic.
std::string findRecipeCycle(const Catalog& catalog, const std::string& item);

// Production planner.
//
// Owns the recipe catalog (one recipe per result item, last registration wins), the
// target and the pool of already available resources. Every mutating call recomputes
// the plan from scratch. A failing call reports why and leaves the calculator exactly as
// it was before the call, including the previous plan.
class Calculator {
public:
  // Starts with an empty placeholder target, so the plan is empty until setTarget().
  Calculator() = default;
  // Later recipes override earlier ones for the same item. No plan is computed.
  explicit Calculator(std::vector<Recipe> recipes);

  // Adds to the available count of resource.item().
  CalcResult addResource(const Stack& resource);

  CalcResult setRecipe(Recipe recipe);
  CalcResult addRecipes(std::vector<Recipe> recipes);

  CalcResult setTarget(Stack target);

  const std::vector<PlanStep>& steps() const { return steps_; }
  const Stack& target() const { return target_; }
  bool hasTarget() const { return !target_.item().empty(); }

  // Sorted by result item.
  std::vector<const Recipe*> recipes() const;
  const Recipe* findRecipe(std::string_view item) const;
  std::size_t recipeCount() const { return recipes_.size(); }

  // Sorted by item.
  std::vector<Stack> resources() const;

private:
  CalcResult commit(Catalog catalog, Stack target, ResourcePool resources);

  Catalog recipes_;
  Stack target_{std::string(), 1};
  ResourcePool resources_;
  std::vector<PlanStep> steps_;
};

} // namespace craftplan::plan
