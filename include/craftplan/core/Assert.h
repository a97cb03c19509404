#pragma once

#include <string_view>

namespace craftplan::core {

// Logs the message at error level and aborts. Reserved for programming errors;
// recoverable failures are reported through result structs instead.
[[noreturn]] void panic(std::string_view message, const char* file, int line);

} // namespace craftplan::core

#define CRAFTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      ::craftplan::core::panic("Assertion failed: " #expr, __FILE__, __LINE__); \
    } \
  } while (0)

#define CRAFTPLAN_ASSERT_MSG(expr, msg) \
  do { \
    if (!(expr)) { \
      ::craftplan::core::panic((msg), __FILE__, __LINE__); \
    } \
  } while (0)
