#include "craftplan/plan/Stack.h"

#include <ostream>
#include <sstream>

namespace craftplan::plan {

std::ostream& operator<<(std::ostream& os, const Stack& stack) {
  return os << stack.item() << " (" << stack.count() << ")";
}

std::string toString(const Stack& stack) {
  std::ostringstream oss;
  oss << stack;
  return oss.str();
}

} // namespace craftplan::plan
