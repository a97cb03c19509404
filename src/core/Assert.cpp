#include "craftplan/core/Assert.h"
#include "craftplan/core/Log.h"

#include <cstdlib>
#include <sstream>

namespace craftplan::core {

[[noreturn]] void panic(std::string_view message, const char* file, int line) {
  std::ostringstream oss;
  oss << "PANIC: " << message << " (" << file << ":" << line << ")";
  log(LogLevel::Error, oss.str());
  std::abort();
}

} // namespace craftplan::core
