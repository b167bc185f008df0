#pragma once
#include <common/macros.h>
#include <common/panic.h>
#include <common/typedefs.h>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/format.h>
#include <source_location>

namespace fs = std::filesystem;
using Path = fs::path;

// clang-format off
#define VERIFY(cond, msg, ...) if (!(cond)) [[unlikely]] { std::source_location loc = std::source_location::current(); \
    cdpr::panic(fmt::format("{} FAILED {}", #cond, fmt::format(msg __VA_OPT__(, ) __VA_ARGS__)), loc, 1);         \
  }
// clang-format on
