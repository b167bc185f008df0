/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>

// stdlib
#include <memory>
#include <regex>
#include <string>
#include <string_view>

namespace cdpr {

// Decides whether an event topic (e.g. `Debugger.paused`) is delivered to a subscription.
class Matcher
{
public:
  virtual ~Matcher() noexcept = default;
  virtual bool Matches(std::string_view topic) const noexcept = 0;
  // The pattern as the subscriber wrote it. Used for logging.
  virtual std::string_view Pattern() const noexcept = 0;
};

class ExactMatcher final : public Matcher
{
  std::string mTopic;

public:
  explicit ExactMatcher(std::string topic) noexcept;
  bool Matches(std::string_view topic) const noexcept final;
  std::string_view Pattern() const noexcept final;
};

// Glob matching over the whole topic: `*` is any run of characters (also empty), `?` exactly one.
class WildcardMatcher final : public Matcher
{
  std::string mPattern;

public:
  explicit WildcardMatcher(std::string pattern) noexcept;
  bool Matches(std::string_view topic) const noexcept final;
  std::string_view Pattern() const noexcept final;

  static bool IsWildcardPattern(std::string_view pattern) noexcept;
};

// ECMAScript regular expression that has to match the entire topic.
class RegexMatcher final : public Matcher
{
  std::string mSource;
  std::regex mRegex;

  RegexMatcher(std::string source, std::regex regex) noexcept;

public:
  static RelayResult<std::unique_ptr<RegexMatcher>> Create(std::string source) noexcept;
  bool Matches(std::string_view topic) const noexcept final;
  std::string_view Pattern() const noexcept final;
};

// Wildcard matcher when `pattern` contains `*` or `?`, exact matcher otherwise.
std::unique_ptr<Matcher> MatcherFromPattern(std::string_view pattern) noexcept;

} // namespace cdpr
