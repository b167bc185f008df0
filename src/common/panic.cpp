/** LICENSE TEMPLATE */
#include "panic.h"

// cdpr
#include <utils/logger.h>

// fmt
#include <fmt/core.h>

// stdlib
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <regex>
#include <source_location>

// system
#include <csignal>
#include <cxxabi.h>
#include <execinfo.h>
#include <unistd.h>

namespace cdpr {
template <typename T>
void
replace_regex(T &str)
{
  static const std::regex str_view_regex("std::basic_string_view<char, std::char_traits<char> >");
  static const std::regex str_regex{
    "std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >"
  };
  static const std::regex json_regex{ "nlohmann::json_abi_v[0-9_]+::basic_json<.*?> >" };

  const std::string replacement = "std::string_view";
  str = std::regex_replace(str, str_view_regex, replacement);

  const std::string str_replacement = "std::string";
  str = std::regex_replace(str, str_regex, str_replacement);

  const std::string json_replacement = "Json";
  str = std::regex_replace(str, json_regex, json_replacement);
}

static void
sanitize(std::string &name)
{
  replace_regex(name);
}

[[noreturn]] static void
panic_exit()
{
  raise(SIGTRAP);
  _exit(-1);
}

[[noreturn]] void
panic(std::string_view err_msg, const char *functionName, const char *file, int line, int strip_levels)
{
  constexpr auto logIf = [](std::string_view msg) { logging::Logger::LogIf(Channel::core, msg); };
  constexpr auto BT_BUF_SIZE = 100;
  const auto savedErrno = errno;
  void *buffer[BT_BUF_SIZE];
  const int nptrs = backtrace(buffer, BT_BUF_SIZE);
  logIf(fmt::format("backtrace() returned {} addresses", nptrs));
  fmt::print(stderr, "backtrace() returned {} addresses\n", nptrs);

  char **strings = backtrace_symbols(buffer, nptrs);
  if (strings != nullptr) {
    for (int j = strip_levels; j < nptrs; j++) {
      size_t demangleLength = 0;
      int stat = 0;
      std::string_view view{ strings[j] };
      if (const auto p = view.find("_Z"); p != std::string_view::npos) {
        view.remove_prefix(p);
        view.remove_suffix(view.size() - std::min(view.size(), view.find_first_of('+')));
        std::string mangled{ view };
        if (char *res = abi::__cxa_demangle(mangled.c_str(), nullptr, &demangleLength, &stat); stat == 0) {
          std::string demangled{ res };
          free(res);
          sanitize(demangled);
          logIf(demangled);
          fmt::print(stderr, "{}\n", demangled);
          continue;
        }
      }
      logIf(strings[j]);
      fmt::print(stderr, "{}\n", strings[j]);
    }
    free(strings);
  } else {
    perror("backtrace_symbols");
  }

  const auto message =
    fmt::format("--- [PANIC] ---\n[FILE]: {}:{}\n[FUNCTION]: {}\n[REASON]: {}\nErrno: {}: {}\n--- [PANIC] ---",
      file,
      line,
      functionName,
      err_msg,
      savedErrno,
      strerror(savedErrno));
  logIf(message);
  fmt::print(stderr, "{}\n", message);
  logging::Logger::GetLogger()->OnAbort();
  panic_exit();
}

void
panic(std::string_view err_msg, const std::source_location &loc, int strip_levels)
{
  panic(err_msg, loc.function_name(), loc.file_name(), static_cast<int>(loc.line()), strip_levels);
}
} // namespace cdpr
