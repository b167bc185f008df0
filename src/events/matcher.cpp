/** LICENSE TEMPLATE */
#include "matcher.h"

// fmt
#include <fmt/format.h>

namespace cdpr {

ExactMatcher::ExactMatcher(std::string topic) noexcept : mTopic(std::move(topic)) {}

bool
ExactMatcher::Matches(std::string_view topic) const noexcept
{
  return mTopic == topic;
}

std::string_view
ExactMatcher::Pattern() const noexcept
{
  return mTopic;
}

WildcardMatcher::WildcardMatcher(std::string pattern) noexcept : mPattern(std::move(pattern)) {}

bool
WildcardMatcher::Matches(std::string_view topic) const noexcept
{
  std::string_view pattern = mPattern;
  size_t p = 0;
  size_t t = 0;
  // Position of the last `*` seen and the topic position it's currently assumed to have consumed up to.
  size_t star = std::string_view::npos;
  size_t starMatch = 0;

  while (t < topic.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == topic[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      starMatch = t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++starMatch;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

std::string_view
WildcardMatcher::Pattern() const noexcept
{
  return mPattern;
}

/* static */
bool
WildcardMatcher::IsWildcardPattern(std::string_view pattern) noexcept
{
  return pattern.find_first_of("*?") != std::string_view::npos;
}

RegexMatcher::RegexMatcher(std::string source, std::regex regex) noexcept
    : mSource(std::move(source)), mRegex(std::move(regex))
{
}

/* static */
RelayResult<std::unique_ptr<RegexMatcher>>
RegexMatcher::Create(std::string source) noexcept
{
  try {
    std::regex regex{ source, std::regex::ECMAScript };
    return std::unique_ptr<RegexMatcher>(new RegexMatcher{ std::move(source), std::move(regex) });
  } catch (const std::regex_error &e) {
    return std::unexpected(RelayError::Invalid(fmt::format("Invalid event pattern '{}': {}", source, e.what())));
  }
}

bool
RegexMatcher::Matches(std::string_view topic) const noexcept
{
  return std::regex_match(topic.begin(), topic.end(), mRegex);
}

std::string_view
RegexMatcher::Pattern() const noexcept
{
  return mSource;
}

std::unique_ptr<Matcher>
MatcherFromPattern(std::string_view pattern) noexcept
{
  if (WildcardMatcher::IsWildcardPattern(pattern)) {
    return std::make_unique<WildcardMatcher>(std::string{ pattern });
  }
  return std::make_unique<ExactMatcher>(std::string{ pattern });
}

} // namespace cdpr
