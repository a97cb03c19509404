#include "craftplan/plan/Calculator.h"

#include "craftplan/core/Checked.h"
#include "craftplan/core/DepthQueue.h"
#include "craftplan/core/Log.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <unordered_set>
#include <utility>

namespace craftplan::plan {

namespace {

CalcResult fail(const char* reason, std::string detail) {
  CalcResult r;
  r.ok = false;
  r.reason = reason;
  r.detail = std::move(detail);
  return r;
}

CalcResult overflow(const std::string& item) {
  return fail("overflow", "count for '" + item + "' exceeds the supported range");
}

// True if every stack of `recipe` scaled by `repeats` fits in Count.
bool fitsScaled(const Recipe& recipe, Count repeats) {
  Count scaled = 0;
  if (!core::checkedMul(recipe.result().count(), repeats, scaled)) return false;
  for (const Stack& ingredient : recipe.ingredients()) {
    if (!core::checkedMul(ingredient.count(), repeats, scaled)) return false;
  }
  return true;
}

// Steps merged per produced item. Entries keep the order in which items first appeared.
class StepBucket {
public:
  // Returns false if the merged step could not be scaled without overflow.
  bool add(const PlanStep& step) {
    const std::string& item = step.recipe->result().item();
    const auto it = index_.find(item);
    if (it == index_.end()) {
      if (!fitsScaled(*step.recipe, step.repeats)) return false;
      index_.emplace(item, entries_.size());
      entries_.push_back(step);
      return true;
    }
    PlanStep& merged = entries_[it->second];
    Count repeats = 0;
    if (!core::checkedAdd(merged.repeats, step.repeats, repeats)) return false;
    if (!fitsScaled(*merged.recipe, repeats)) return false;
    merged.repeats = repeats;
    return true;
  }

  const PlanStep* find(const std::string& item) const {
    const auto it = index_.find(item);
    return (it != index_.end()) ? &entries_[it->second] : nullptr;
  }

  bool empty() const { return entries_.empty(); }
  const std::vector<PlanStep>& entries() const { return entries_; }

private:
  std::vector<PlanStep> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Phase A: breadth-first demand propagation from the target. Steps come out in discovery
// order, consumers before the producers of their ingredients.
CalcResult propagateDemand(const Catalog& catalog,
                           const Stack& target,
                           const ResourcePool& resources,
                           std::vector<PlanStep>& out) {
  ResourcePool storage = resources;
  std::unordered_map<std::string, Count> surplus;
  std::unordered_map<std::string, Count> demand;
  demand.emplace(target.item(), target.count());

  core::DepthQueue<std::string> queue;
  queue.pushIncrease(target.item(), 0);

  while (auto next = queue.popMin()) {
    const std::string& item = next->key;

    // Already resolved by an earlier pop of the same item.
    const auto dit = demand.find(item);
    if (dit == demand.end()) continue;
    Count count = dit->second;
    demand.erase(dit);

    if (const auto sit = surplus.find(item); sit != surplus.end()) {
      const Count used = std::min(sit->second, count);
      sit->second -= used;
      count -= used;
    }
    if (count == 0) continue;

    if (const auto pit = storage.find(item); pit != storage.end()) {
      const Count drawn = std::min(pit->second, count);
      if (drawn > 0) {
        out.push_back({std::make_shared<const Recipe>(Recipe::inStorage(item)), drawn});
        pit->second -= drawn;
        count -= drawn;
      }
    }
    if (count == 0) continue;

    const auto rit = catalog.find(item);
    if (rit == catalog.end()) {
      out.push_back({std::make_shared<const Recipe>(Recipe::rawMaterial(item)), count});
      continue;
    }

    const RecipePtr& recipe = rit->second;
    const Count yield = recipe->result().count();
    if (yield == 0) return fail("invalid", "recipe for '" + item + "' yields nothing");

    const Count repeats = core::ceilDiv(count, yield);
    Count produced = 0;
    if (!core::checkedMul(repeats, yield, produced)) return overflow(item);
    out.push_back({recipe, repeats});

    // Surplus was drained above, so this is the only live entry for the item.
    if (produced > count) surplus[item] = produced - count;

    auto depth = next->depth;
    if (depth == queue.max()) {
      depth = queue.compact(depth);
      CRAFTPLAN_LOG_DEBUG("plan: compacted depth queue at '" + item + "'");
    }

    for (const Stack& ingredient : recipe->ingredients()) {
      Count need = 0;
      if (!core::checkedMul(ingredient.count(), repeats, need)) return overflow(ingredient.item());
      Count& pending = demand[ingredient.item()];
      if (!core::checkedAdd(pending, need, pending)) return overflow(ingredient.item());
      queue.pushIncrease(ingredient.item(), depth + 1);
    }
  }

  if (!demand.empty()) {
    std::string items;
    for (const auto& kv : demand) {
      if (!items.empty()) items += ", ";
      items += kv.first;
    }
    return fail("internal", "unresolved demand after propagation: " + items);
  }
  return {};
}

// Phase B: staged topological ordering of the phase A steps.
CalcResult orderSteps(const std::vector<PlanStep>& candidates, std::vector<PlanStep>& out) {
  StepBucket raw;
  StepBucket storage;
  std::vector<PlanStep> crafted;

  for (const PlanStep& step : candidates) {
    switch (step.recipe->kind()) {
      case RecipeKind::RawMaterial:
        if (!raw.add(step)) return overflow(step.recipe->result().item());
        break;
      case RecipeKind::InStorage:
        if (!storage.add(step)) return overflow(step.recipe->result().item());
        break;
      case RecipeKind::Crafted:
        crafted.push_back(step);
        break;
    }
  }

  // Unconsumed storage per item; `emitted` once its In Storage step is in the plan.
  struct Stock {
    Count remaining{0};
    bool emitted{false};
  };
  std::unordered_map<std::string, Stock> stock;
  for (const PlanStep& s : storage.entries()) {
    Count units = 0;
    if (!core::checkedMul(s.recipe->result().count(), s.repeats, units)) {
      return overflow(s.recipe->result().item());
    }
    stock.emplace(s.recipe->result().item(), Stock{units, false});
  }

  // An item is available once something produced it and no crafting step for it is
  // still waiting to be scheduled.
  std::unordered_set<std::string> available;
  std::unordered_map<std::string, std::size_t> pendingCrafted;
  for (const PlanStep& s : crafted) ++pendingCrafted[s.recipe->result().item()];

  const auto isAvailable = [&](const std::string& item) {
    if (available.find(item) == available.end()) return false;
    const auto it = pendingCrafted.find(item);
    return it == pendingCrafted.end() || it->second == 0;
  };

  for (const PlanStep& s : raw.entries()) {
    out.push_back(s);
    available.insert(s.recipe->result().item());
  }

  while (!crafted.empty()) {
    StepBucket stage;
    std::vector<PlanStep> deferred;

    for (const PlanStep& step : crafted) {
      // Storage this step would take for ingredients nothing has produced yet.
      std::unordered_map<std::string, Count> claims;
      bool eligible = true;
      for (const Stack& ingredient : step.recipe->ingredients()) {
        Count need = 0;
        if (!core::checkedMul(ingredient.count(), step.repeats, need)) return overflow(ingredient.item());
        if (need == 0 || isAvailable(ingredient.item())) continue;
        const auto sit = stock.find(ingredient.item());
        if (sit != stock.end()) {
          Count& claim = claims[ingredient.item()];
          Count total = 0;
          if (core::checkedAdd(claim, need, total) && total <= sit->second.remaining) {
            claim = total;
            continue;
          }
        }
        eligible = false;
        break;
      }
      if (!eligible) {
        deferred.push_back(step);
        continue;
      }

      // Stocked ingredients enter the plan right before their first consumer.
      for (const Stack& ingredient : step.recipe->ingredients()) {
        const auto sit = stock.find(ingredient.item());
        if (sit == stock.end() || sit->second.emitted) continue;
        out.push_back(*storage.find(ingredient.item()));
        sit->second.emitted = true;
      }
      for (const auto& kv : claims) stock.find(kv.first)->second.remaining -= kv.second;

      if (!stage.add(step)) return overflow(step.recipe->result().item());
    }

    if (stage.empty()) {
      return fail("internal", std::to_string(deferred.size()) + " steps could not be scheduled");
    }

    for (const PlanStep& s : stage.entries()) {
      out.push_back(s);
      available.insert(s.recipe->result().item());
    }
    crafted.swap(deferred);

    // Availability changes only between stages.
    for (auto& kv : pendingCrafted) kv.second = 0;
    for (const PlanStep& s : crafted) ++pendingCrafted[s.recipe->result().item()];
  }

  // Storage nothing consumed, e.g. the target itself.
  for (const PlanStep& s : storage.entries()) {
    const auto sit = stock.find(s.recipe->result().item());
    if (sit != stock.end() && !sit->second.emitted) out.push_back(s);
  }
  return {};
}

} // namespace

std::string toString(const CalcResult& result) {
  if (result.ok) return "ok";
  std::string s = result.reason ? result.reason : "error";
  if (!result.detail.empty()) s += ": " + result.detail;
  return s;
}

std::string findRecipeCycle(const Catalog& catalog, const std::string& item) {
  const auto root = catalog.find(item);
  if (root == catalog.end()) return {};

  enum class Mark : std::uint8_t { Open, Done };
  struct Frame {
    const std::string* item;
    const Recipe* recipe;
    std::size_t next;
  };

  std::unordered_map<std::string, Mark> marks;
  std::vector<Frame> path;
  marks.emplace(root->first, Mark::Open);
  path.push_back({&root->first, root->second.get(), 0});

  while (!path.empty()) {
    Frame& top = path.back();
    if (top.next == top.recipe->ingredients().size()) {
      marks[*top.item] = Mark::Done;
      path.pop_back();
      continue;
    }

    const std::string& ingredient = top.recipe->ingredients()[top.next++].item();
    const auto rit = catalog.find(ingredient);
    if (rit == catalog.end()) continue;

    const auto mit = marks.find(ingredient);
    if (mit == marks.end()) {
      marks.emplace(rit->first, Mark::Open);
      path.push_back({&rit->first, rit->second.get(), 0});
      continue;
    }
    if (mit->second == Mark::Done) continue;

    // Back edge: the cycle runs from the open frame for `ingredient` to the top.
    std::string cycle;
    bool inCycle = false;
    for (const Frame& f : path) {
      if (*f.item == ingredient) inCycle = true;
      if (!inCycle) continue;
      cycle += *f.item;
      cycle += " -> ";
    }
    cycle += ingredient;
    return cycle;
  }
  return {};
}

CalcResult computePlan(const Catalog& catalog,
                       const Stack& target,
                       const ResourcePool& resources,
                       std::vector<PlanStep>& out) {
  if (target.item().empty() || target.count() == 0) {
    out.clear();
    return {};
  }

  if (const std::string cycle = findRecipeCycle(catalog, target.item()); !cycle.empty()) {
    return fail("cycle", cycle);
  }

  std::vector<PlanStep> candidates;
  if (CalcResult r = propagateDemand(catalog, target, resources, candidates); !r.ok) return r;

  std::vector<PlanStep> ordered;
  ordered.reserve(candidates.size());
  if (CalcResult r = orderSteps(candidates, ordered); !r.ok) return r;

  out.swap(ordered);
  return {};
}

Calculator::Calculator(std::vector<Recipe> recipes) {
  for (Recipe& recipe : recipes) {
    std::string item = recipe.result().item();
    recipes_[std::move(item)] = std::make_shared<const Recipe>(std::move(recipe));
  }
}

CalcResult Calculator::addResource(const Stack& resource) {
  ResourcePool pool = resources_;
  Count& count = pool[resource.item()];
  if (!core::checkedAdd(count, resource.count(), count)) {
    const CalcResult r = overflow(resource.item());
    CRAFTPLAN_LOG_WARN("calculator: addResource rejected (" + toString(r) + ")");
    return r;
  }
  return commit(recipes_, target_, std::move(pool));
}

CalcResult Calculator::setRecipe(Recipe recipe) {
  std::vector<Recipe> one;
  one.push_back(std::move(recipe));
  return addRecipes(std::move(one));
}

CalcResult Calculator::addRecipes(std::vector<Recipe> recipes) {
  Catalog catalog = recipes_;
  for (Recipe& recipe : recipes) {
    if (recipe.result().count() == 0) {
      const CalcResult r = fail("invalid", "recipe for '" + recipe.result().item() + "' yields nothing");
      CRAFTPLAN_LOG_WARN("calculator: addRecipes rejected (" + toString(r) + ")");
      return r;
    }
    std::string item = recipe.result().item();
    catalog[std::move(item)] = std::make_shared<const Recipe>(std::move(recipe));
  }
  return commit(std::move(catalog), target_, resources_);
}

CalcResult Calculator::setTarget(Stack target) {
  return commit(recipes_, std::move(target), resources_);
}

CalcResult Calculator::commit(Catalog catalog, Stack target, ResourcePool resources) {
  std::vector<PlanStep> steps;
  const CalcResult r = computePlan(catalog, target, resources, steps);
  if (!r.ok) {
    if (r.reason && std::string_view(r.reason) == "internal") {
      CRAFTPLAN_LOG_ERROR("calculator: " + toString(r));
    } else {
      CRAFTPLAN_LOG_WARN("calculator: " + toString(r));
    }
    return r;
  }

  recipes_ = std::move(catalog);
  target_ = std::move(target);
  resources_ = std::move(resources);
  steps_ = std::move(steps);

  CRAFTPLAN_LOG_DEBUG("calculator: " + std::to_string(steps_.size()) + " steps for " + toString(target_));
  return r;
}

std::vector<const Recipe*> Calculator::recipes() const {
  std::vector<const Recipe*> out;
  out.reserve(recipes_.size());
  for (const auto& kv : recipes_) out.push_back(kv.second.get());
  std::sort(out.begin(), out.end(), [](const Recipe* a, const Recipe* b) {
    return a->result().item() < b->result().item();
  });
  return out;
}

const Recipe* Calculator::findRecipe(std::string_view item) const {
  const auto it = recipes_.find(std::string(item));
  return (it != recipes_.end()) ? it->second.get() : nullptr;
}

std::vector<Stack> Calculator::resources() const {
  std::vector<Stack> out;
  out.reserve(resources_.size());
  for (const auto& kv : resources_) out.emplace_back(kv.first, kv.second);
  std::sort(out.begin(), out.end(), [](const Stack& a, const Stack& b) { return a.item() < b.item(); });
  return out;
}

} // namespace craftplan::plan
