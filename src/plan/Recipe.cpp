#include "craftplan/plan/Recipe.h"

namespace craftplan::plan {

Recipe Recipe::rawMaterial(std::string item) {
  Recipe r(Stack(std::move(item), 1), std::string(kRawMaterialMethod), {});
  r.kind_ = RecipeKind::RawMaterial;
  return r;
}

Recipe Recipe::inStorage(std::string item) {
  Recipe r(Stack(std::move(item), 1), std::string(kInStorageMethod), {});
  r.kind_ = RecipeKind::InStorage;
  return r;
}

const char* recipeKindName(RecipeKind kind) {
  switch (kind) {
    case RecipeKind::Crafted: return "crafted";
    case RecipeKind::RawMaterial: return "raw";
    case RecipeKind::InStorage: return "storage";
  }
  return "?";
}

} // namespace craftplan::plan
