/** LICENSE TEMPLATE */
#pragma once

#include <string_view>

namespace std {
struct source_location;
} // namespace std

// defines PANIC macro. Responsibility on caller to include required headers.

#define PANIC(err_msg)                                                                                            \
  {                                                                                                               \
    auto loc = std::source_location::current();                                                                   \
    cdpr::panic(err_msg, loc, 1);                                                                                 \
  }

#ifndef CDPR_UNREACHABLE
#define CDPR_UNREACHABLE __builtin_unreachable();
#endif

namespace cdpr {
[[noreturn]] void panic(std::string_view err_msg, const char *functionName, const char *file, int line,
                        int strip_levels);

[[noreturn]] void panic(std::string_view err_msg, const std::source_location &loc, int strip_levels);
} // namespace cdpr
