/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common.h>
#include <common/typedefs.h>
#include <utils/command.h>
#include <utils/util.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <charconv>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using namespace std::string_view_literals;

namespace cdpr::cfg {

#define FOR_CLI_EACH_PARSE_ERROR(MAKE_ERR)                                                                        \
  MAKE_ERR(None, "Error not set.")                                                                                \
  MAKE_ERR(MissingArgValue, "Command line option is missing it's value.")                                         \
  MAKE_ERR(InvalidFormat, "Invalid format of argument.")                                                          \
  MAKE_ERR(UnrecognizedArgument, "Argument is not a recognized option or command.")                               \
  MAKE_ERR(DirectoryDoesNotExist, "Directory does not exist")                                                     \
  MAKE_ERR(PortOutOfRange, "Port must be in the range 1-65535")

enum class ParseErrorType : u8
{
  FOR_CLI_EACH_PARSE_ERROR(DEFAULT_ENUM)
};

struct ParseOk
{
};

struct ParserError
{
  ParseErrorType mError;
  std::vector<std::string_view> mInputs;

  operator std::unexpected<ParserError>() && noexcept { return std::unexpected<ParserError>(std::move(*this)); }
};

template <typename T> using ParseResult = std::expected<T, ParserError>;

class ArgIterator
{
public:
  constexpr ArgIterator(int argc, const char **argv) : mArgCount(argc), mArgs(argv) {}

  bool
  HasNext() const noexcept
  {
    return mIndex < mArgCount || mInsideInlineArgument.has_value();
  }

  // Starts a new parse pass. Every argument handed out from here until the next call belongs to the option
  // that is currently being parsed, which is what `Error` reports back.
  std::string_view
  BeginNext() noexcept
  {
    RememberPosition();
    return *GetNext();
  }

  std::optional<std::string_view>
  GetNext() noexcept
  {
    if (mInsideInlineArgument) {
      std::string_view value = mArgs[mIndex];
      value.remove_prefix(mInsideInlineArgument.value());
      mInsideInlineArgument = {};
      ++mIndex;
      return value;
    }

    if (mIndex >= mArgCount) {
      return std::nullopt;
    }
    std::string_view value = mArgs[mIndex];
    // --port=8080 form. Only options get split, positional values containing '=' are taken whole.
    auto inlineValuePos = value.find_first_of('=');
    if (value.starts_with("-") && inlineValuePos != value.npos) {
      mInsideInlineArgument = inlineValuePos + 1;
      return value.substr(0, inlineValuePos);
    } else {
      ++mIndex;
    }
    return value;
  }

  std::span<const char *>
  Args() const noexcept
  {
    return std::span{ mArgs, mArgs + mArgCount };
  }

  std::unexpected<ParserError>
  Error(ParseErrorType type) noexcept
  {
    return std::unexpected(ParserError{ type, GetArgsCurrentlyBeingParsed() });
  }

private:
  std::vector<std::string_view>
  GetArgsCurrentlyBeingParsed()
  {
    // Include the current argument, which may only have been partially consumed (--foo=bar).
    const auto end = std::min(mArgCount, mInsideInlineArgument ? mIndex + 1 : mIndex);
    std::vector<std::string_view> result;
    if (end > mRememberedIndex) {
      CopyTo(Args().subspan(mRememberedIndex, end - mRememberedIndex), result);
    }
    return result;
  }

  void
  RememberPosition() noexcept
  {
    mRememberedIndex = mIndex;
  }

  int mArgCount;
  const char **mArgs;
  int mIndex{ 1 };
  std::optional<size_t> mInsideInlineArgument{};
  int mRememberedIndex{ 0 };
};

#ifndef TryExpected
#define TryExpected(iterator)                                                                                     \
  ({                                                                                                              \
    auto ___MAYBE_VALUE___ = iterator.GetNext();                                                                  \
    if (!___MAYBE_VALUE___) {                                                                                     \
      return iterator.Error(ParseErrorType::MissingArgValue);                                                     \
    }                                                                                                             \
    *___MAYBE_VALUE___;                                                                                           \
  })
#endif

struct OptionMetadata
{
  std::string mShortName;
  std::string mLongName;
  HelpMessage mInfo;
  bool mIsFlag;
};

template <typename ParseInput> struct IOption : OptionMetadata
{
  using Input = ParseInput;
  virtual std::expected<ParseOk, ParserError> Parse(ParseInput it) noexcept = 0;
  virtual void ApplyDefault() noexcept = 0;
  virtual ~IOption() noexcept = default;
};

// Writes the parsed value straight into a field of the configuration object.
template <typename T, typename ParseInput> class DirectOption : public IOption<ParseInput>
{
  using Data = OptionMetadata;
  using IBase = IOption<ParseInput>;

public:
  using ParserFn = ParseResult<T> (*)(typename IBase::Input &);

  DirectOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage helpMessage,
    T &reference,
    ParserFn parser,
    T defaultValue)
      : mReference(&reference), mParseFn(parser), mDefault(std::move(defaultValue))
  {
    Data::mShortName = shortName;
    Data::mLongName = longName;
    Data::mInfo = helpMessage;
    Data::mIsFlag = std::is_same_v<T, bool>;
  }

  std::expected<ParseOk, ParserError>
  Parse(ParseInput it) noexcept override
  {
    auto result = mParseFn(it);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }
    *mReference = std::move(result.value());
    return ParseOk{};
  }

  void
  ApplyDefault() noexcept override
  {
    *mReference = mDefault;
  }

private:
  T *mReference;
  ParserFn mParseFn;
  T mDefault;
};

struct CommandLineResult
{
  std::vector<ParserError> mErrors;
  // Set when a command (like --help) has already done everything the invocation asked for.
  bool mExitRequested{ false };
};

class CommandLineRegistry
{
  static constexpr auto UNIFORM_LINE_INDENT = 2;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<ArgIterator &>>> mOptions;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<std::string_view>>> mEnvironmentVariables;
  std::unordered_map<std::string_view, std::shared_ptr<cmd::ICommand>> mCommands;
  // Width of the widest "-c, --com <value>" column, so help output lines up without a terminal.
  size_t mLeftColumnDisplayWidth{ 0 };
  bool mParseCompleted{ false };
  bool mExitRequested{ false };

  void
  AssertUnique(std::string_view shortName, std::string_view longName) noexcept
  {
    VERIFY(!shortName.empty() || !longName.empty(), "You've not given this option/command a name!");
    if (!longName.empty()) {
      VERIFY(mOptions.count(longName) == 0, "Already added option {}", longName);
      VERIFY(mCommands.count(longName) == 0, "Already added command {}", longName);
    }

    if (!shortName.empty()) {
      VERIFY(mOptions.count(shortName) == 0, "Already added option {}", shortName);
      VERIFY(mCommands.count(shortName) == 0, "Already added command {}", shortName);
    }
  }

  void
  UpdateLeftColumnWidth(bool isFlag, std::string_view shortName, std::string_view longName) noexcept
  {
    const auto leftColumnWidth =
      shortName.size() + longName.size() + (isFlag ? 0 : kValuePlaceHolder.size()) + UNIFORM_LINE_INDENT;

    mLeftColumnDisplayWidth = std::max(mLeftColumnDisplayWidth, leftColumnWidth);
  }

  template <typename T, typename Self>
  static auto &
  MapFor(Self &self) noexcept
  {
    static_assert(std::is_base_of_v<IOption<ArgIterator &>, T> ||
                    std::is_base_of_v<IOption<std::string_view>, T> || std::is_base_of_v<cmd::ICommand, T>,
      "T must be derived from IOption or cmd::ICommand");

    if constexpr (std::is_base_of_v<IOption<ArgIterator &>, T>) {
      return self.mOptions;
    } else if constexpr (std::is_base_of_v<IOption<std::string_view>, T>) {
      return self.mEnvironmentVariables;
    } else {
      return self.mCommands;
    }
  }

  template <typename T>
  void
  AddOption(std::string_view shortName, std::string_view longName, std::shared_ptr<T> &&item) noexcept
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    AssertUnique(shortName, longName);
    auto &map = MapFor<T>(*this);
    std::shared_ptr<T> ptr{ std::move(item) };
    if (!shortName.empty()) {
      map.emplace(shortName, ptr);
    }

    if (!longName.empty()) {
      map.emplace(longName, std::move(ptr));
    }
  }

  template <typename T>
  void
  AddEnvironmentVariable(std::string_view name, std::shared_ptr<T> &&item) noexcept
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    VERIFY(mEnvironmentVariables.count(name) == 0, "Environment variable option already configured.");
    auto &map = MapFor<T>(*this);
    map.emplace(name, std::move(item));
  }

  // Options are registered under both their short and long name; return every one only once.
  template <typename T>
  std::vector<std::shared_ptr<T>>
  GetAllOf() const noexcept
  {
    const auto &map = MapFor<T>(*this);
    std::vector<std::shared_ptr<T>> result;
    result.reserve(map.size());

    std::unordered_set<const void *> taken{};

    for (const auto &[k, v] : map) {
      if (!taken.contains(v.get())) {
        result.push_back(v);
        taken.insert(v.get());
      }
    }
    return result;
  }

public:
  static constexpr auto kValuePlaceHolder = " <value> "sv;

  std::vector<std::shared_ptr<IOption<std::string_view>>>
  GetEnvironmentVariableOptions() const noexcept
  {
    return GetAllOf<IOption<std::string_view>>();
  }

  std::vector<std::shared_ptr<IOption<ArgIterator &>>>
  GetOptions() const noexcept
  {
    return GetAllOf<IOption<ArgIterator &>>();
  }

  std::vector<std::shared_ptr<cmd::ICommand>>
  GetCommands() const noexcept
  {
    return GetAllOf<cmd::ICommand>();
  }

  template <typename Fn>
  void
  AddLambdaCommand(std::string_view shortName, std::string_view longName, std::string_view help, Fn func) noexcept
  {
    UpdateLeftColumnWidth(true, shortName, longName);
    auto cmd = std::make_shared<cmd::LambdaCommand<Fn>>(cmd::LambdaCommand<Fn>{ std::move(func) });
    cmd->mLongName = longName;
    cmd->mShortName = shortName;
    cmd->mHelpMessage = help;

    AddOption(shortName, longName, std::move(cmd));
  }

  template <typename ParseInput, typename T, typename ConvertibleToT>
  void
  AddOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage message,
    T &variable,
    typename DirectOption<T, ParseInput>::ParserFn parser,
    ConvertibleToT defaultVal) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    UpdateLeftColumnWidth(std::is_same_v<T, bool>, shortName, longName);

    auto opt = std::make_shared<DirectOption<T, ParseInput>>(
      shortName, longName, message, variable, parser, T(std::move(defaultVal)));

    AddOption(shortName, longName, std::move(opt));
  }

  template <typename T, typename ConvertibleToT = T>
  void
  AddEnvironmentVariable(std::string_view name,
    HelpMessage message,
    T &variable,
    typename DirectOption<T, std::string_view>::ParserFn parser,
    ConvertibleToT defaultVal = T{}) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    UpdateLeftColumnWidth(/* isFlag */ false, "", name);

    auto opt = std::make_shared<DirectOption<T, std::string_view>>(
      "", name, message, variable, parser, T(std::move(defaultVal)));

    AddEnvironmentVariable(name, std::move(opt));
  }

  // Commands call this to tell `Parse` the process should exit successfully once parsing is done.
  void
  RequestExit() noexcept
  {
    mExitRequested = true;
  }

  CommandLineResult Parse(int argc, const char **argv) noexcept;
  void ParseEnvironmentVariableOptions() noexcept;

  void PrintHelp() const noexcept;
  void PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept;
  std::pair<u16, u16> GetTerminalSize() const noexcept;
};

template <typename ResultType> struct FromTraits;

#define NumberTrait(NumberType)                                                                                   \
  template <> struct FromTraits<NumberType>                                                                       \
  {                                                                                                               \
    static ParseResult<NumberType>                                                                                \
    From(ArgIterator &it)                                                                                         \
    {                                                                                                             \
      auto arg = TryExpected(it);                                                                                 \
                                                                                                                  \
      NumberType number;                                                                                          \
      auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), number);                              \
      if (ec == std::errc() && ptr == arg.data() + arg.size()) {                                                  \
        return number;                                                                                            \
      } else {                                                                                                    \
        return it.Error(ParseErrorType::InvalidFormat);                                                           \
      }                                                                                                           \
    }                                                                                                             \
                                                                                                                  \
    static ParseResult<NumberType>                                                                                \
    From(std::string_view arg) noexcept                                                                           \
    {                                                                                                             \
      if (arg.empty())                                                                                            \
        return std::unexpected(ParserError{ ParseErrorType::MissingArgValue, {} });                               \
      NumberType number;                                                                                          \
      auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), number);                              \
      if (ec == std::errc() && ptr == arg.data() + arg.size()) {                                                  \
        return number;                                                                                            \
      } else {                                                                                                    \
        return std::unexpected(cdpr::cfg::ParserError{ ParseErrorType::InvalidFormat, { arg } });                 \
      }                                                                                                           \
    }                                                                                                             \
  };

#define FOR_EACH_PRIMITIVE(PRIM) PRIM(u32)

#define AsIsTrait(Type)                                                                                           \
  template <> struct FromTraits<Type>                                                                             \
  {                                                                                                               \
    static ParseResult<Type>                                                                                      \
    From(ArgIterator &it)                                                                                         \
    {                                                                                                             \
      auto arg = TryExpected(it);                                                                                 \
      return Type{ arg };                                                                                         \
    }                                                                                                             \
  };

#define FOR_EACH_AS_IS(AS_IS) AS_IS(std::string)

FOR_EACH_AS_IS(AsIsTrait)

FOR_EACH_PRIMITIVE(NumberTrait)

// Parser for boolean flags; a flag takes no value, its presence sets it.
inline ParseResult<bool>
FlagIsSet(ArgIterator &) noexcept
{
  return true;
}

} // namespace cdpr::cfg

template <> struct fmt::formatter<cdpr::cfg::ParseErrorType> : public fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto
  format(const cdpr::cfg::ParseErrorType &option, FormatContext &context) const
  {
#define PARSE_ERROR_MSG(EnumValue, Message, ...)                                                                  \
  case cdpr::cfg::ParseErrorType::EnumValue:                                                                      \
    return fmt::formatter<std::string_view>::format(Message, context);

    switch (option) {
      FOR_CLI_EACH_PARSE_ERROR(PARSE_ERROR_MSG)
    }
#undef PARSE_ERROR_MSG
    CDPR_UNREACHABLE
  }
};

template <> struct fmt::formatter<cdpr::cfg::ParserError> : public fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto
  format(const cdpr::cfg::ParserError &error, FormatContext &ctx) const
  {
    auto it = fmt::format_to(ctx.out(), "Parse error: {}", error.mError);
    if (!error.mInputs.empty()) {
      it = fmt::format_to(it, " ({})", fmt::join(error.mInputs, " "));
    }
    return it;
  }
};

#undef FOR_CLI_EACH_PARSE_ERROR
