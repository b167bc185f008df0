/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/typedefs.h>

// stdlib
#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace cdpr {

template <typename Delimiter>
constexpr std::vector<std::string_view>
SplitString(std::string_view str, Delimiter delim) noexcept
{
  std::vector<std::string_view> result{};
  auto last = false;
  for (auto i = str.find(delim); i != std::string_view::npos || !last; i = str.find(delim)) {
    last = (i == std::string_view::npos);
    auto sub = str.substr(0, i);
    if (!sub.empty()) {
      result.push_back(sub);
    }
    if (!last) {
      str.remove_prefix(i + 1);
    }
  }
  return result;
}

template <typename CA, typename CB = CA>
constexpr auto
CopyTo(const CA &c, CB &out)
{
  out.reserve(c.size() + out.size());
  std::copy(c.begin(), c.end(), std::back_inserter(out));
}

// Removes leading and trailing ASCII whitespace.
constexpr std::string_view
Trim(std::string_view str) noexcept
{
  constexpr std::string_view kWhitespace = " \t\r\n";
  const auto begin = str.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = str.find_last_not_of(kWhitespace);
  return str.substr(begin, end - begin + 1);
}

} // namespace cdpr
