/** LICENSE TEMPLATE */
#pragma once
// cdpr
#include <common/typedefs.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#if defined(__clang__)
#define CDPR_UNREACHABLE __builtin_unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define CDPR_UNREACHABLE __builtin_unreachable();
#endif

#ifndef NO_COPY
/// Types that use NO_COPY in this codebase are owned by one subsystem and handed out by reference or pointer.
#define NO_COPY(CLASS)                                                                                            \
  CLASS(const CLASS &) = delete;                                                                                  \
  CLASS(CLASS &) = delete;                                                                                        \
  CLASS &operator=(CLASS &) = delete;                                                                             \
  CLASS &operator=(const CLASS &) = delete;
#endif

#define DEFAULT_ENUM(Value, ...) Value,

#define STRINGIFY_VAL(x, ...) #x,

#define CAST_FN(Value, ...)                                                                                       \
  case static_cast<i32>(Value):                                                                                   \
    return Value;

template <typename T> struct Enum
{
  static constexpr u32 Count() noexcept;
  static constexpr std::optional<T> FromInt(int value) noexcept;
};

#define ENUM_FMT(ENUM_TYPE)                                                                                       \
  template <> struct fmt::formatter<ENUM_TYPE> : public fmt::formatter<std::string_view>                          \
  {                                                                                                               \
    template <typename FormatContext>                                                                             \
    auto                                                                                                          \
    format(const ENUM_TYPE &value, FormatContext &ctx) const                                                      \
    {                                                                                                             \
      return fmt::formatter<std::string_view>::format(Enum<ENUM_TYPE>::ToString(value), ctx);                     \
    }                                                                                                             \
  };

// Each enum gets its own metadata namespace. Several of the protocol enums share enumerator names (`enable`,
// `disable`, ...) and would otherwise collide when brought in with `using enum`.
#define PREDEFINED_ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, EACH_FN)                                               \
  namespace detail::ENUM_TYPE##Metadata {                                                                         \
  using enum ENUM_TYPE;                                                                                           \
  static constexpr auto Ids = std::to_array<ENUM_TYPE>({ FOR_EACH(DEFAULT_ENUM) });                               \
  static constexpr auto Names = std::to_array<std::string_view>({ FOR_EACH(STRINGIFY_VAL) });                     \
  }                                                                                                               \
  template <> struct Enum<ENUM_TYPE>                                                                              \
  {                                                                                                               \
    static consteval auto                                                                                         \
    EnumBaseOffset() noexcept                                                                                     \
    {                                                                                                             \
      return std::to_underlying(detail::ENUM_TYPE##Metadata::Ids[0]);                                             \
    }                                                                                                             \
                                                                                                                  \
    static constexpr u32                                                                                          \
    Count() noexcept                                                                                              \
    {                                                                                                             \
      return detail::ENUM_TYPE##Metadata::Ids.size();                                                             \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromInt(auto value) noexcept                                                                                  \
    {                                                                                                             \
      using enum ENUM_TYPE;                                                                                       \
      if (value < std::to_underlying(detail::ENUM_TYPE##Metadata::Ids.front()) ||                                 \
          value > std::to_underlying(detail::ENUM_TYPE##Metadata::Ids.back())) {                                  \
        return std::nullopt;                                                                                      \
      }                                                                                                           \
      switch (value) {                                                                                            \
        FOR_EACH(CAST_FN)                                                                                         \
      default:                                                                                                    \
        return std::nullopt;                                                                                      \
      }                                                                                                           \
      CDPR_UNREACHABLE                                                                                            \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const ENUM_TYPE>                                                                   \
    Variants() noexcept                                                                                           \
    {                                                                                                             \
      return std::span{ detail::ENUM_TYPE##Metadata::Ids };                                                       \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::string_view                                                                             \
    ToString(ENUM_TYPE value) noexcept                                                                            \
    {                                                                                                             \
      constexpr auto INDEX_OFFSET = EnumBaseOffset();                                                             \
      return detail::ENUM_TYPE##Metadata::Names[std::to_underlying(value) - INDEX_OFFSET];                        \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const std::string_view>                                                            \
    Names() noexcept                                                                                              \
    {                                                                                                             \
      return std::span{ detail::ENUM_TYPE##Metadata::Names };                                                     \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromString(std::string_view str) noexcept                                                                     \
    {                                                                                                             \
      auto index = 0;                                                                                             \
      for (const auto &n : Names()) {                                                                             \
        if (n == str)                                                                                             \
          return detail::ENUM_TYPE##Metadata::Ids[index];                                                         \
        ++index;                                                                                                  \
      }                                                                                                           \
      return {};                                                                                                  \
    }                                                                                                             \
  };                                                                                                              \
  ENUM_FMT(ENUM_TYPE)

#define ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, EACH_FN, UNDERLYING_TYPE)                                         \
  enum class ENUM_TYPE : UNDERLYING_TYPE                                                                          \
  {                                                                                                               \
    FOR_EACH(EACH_FN)                                                                                             \
  };                                                                                                              \
  PREDEFINED_ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, EACH_FN)
