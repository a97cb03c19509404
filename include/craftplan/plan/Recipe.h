#pragma once

#include "craftplan/plan/Stack.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace craftplan::plan {

enum class RecipeKind : std::uint8_t {
  Crafted     = 0, // a catalog rule
  RawMaterial = 1, // item with no known recipe
  InStorage   = 2  // item drawn from the resource pool
};

inline constexpr std::string_view kRawMaterialMethod = "Raw Material";
inline constexpr std::string_view kInStorageMethod = "In Storage";

// A known way to produce a stack from a set of other stacks.
//
// Executing the recipe once consumes every ingredient stack and produces `result`.
// Pseudo-recipes (raw material, in storage) produce one unit of their item from nothing;
// they only exist inside plans.
class Recipe {
public:
  Recipe() = default;
  Recipe(Stack result, std::string method, std::vector<Stack> ingredients)
      : result_(std::move(result)), method_(std::move(method)), ingredients_(std::move(ingredients)) {}

  static Recipe rawMaterial(std::string item);
  static Recipe inStorage(std::string item);

  const Stack& result() const { return result_; }
  const std::string& method() const { return method_; }
  const std::vector<Stack>& ingredients() const { return ingredients_; }
  RecipeKind kind() const { return kind_; }
  bool isCrafted() const { return kind_ == RecipeKind::Crafted; }

  friend bool operator==(const Recipe& a, const Recipe& b) {
    return a.kind_ == b.kind_ && a.result_ == b.result_ && a.method_ == b.method_ &&
           a.ingredients_ == b.ingredients_;
  }
  friend bool operator!=(const Recipe& a, const Recipe& b) { return !(a == b); }

private:
  Stack result_;
  std::string method_;
  std::vector<Stack> ingredients_;
  RecipeKind kind_{RecipeKind::Crafted};
};

// Recipes are shared between the catalog and plan steps and never modified once shared.
using RecipePtr = std::shared_ptr<const Recipe>;

const char* recipeKindName(RecipeKind kind);

} // namespace craftplan::plan
