/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/macros.h>
#include <common/typedefs.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <expected>
#include <string>
#include <utility>

#define FOR_EACH_ERROR_KIND(ERR)                                                                                  \
  ERR(ConnectionError, "No usable transport, or the transport went away.")                                       \
  ERR(TimeoutError, "A bounded wait ran out.")                                                                    \
  ERR(ProtocolError, "The inspector answered with an error response.")                                           \
  ERR(StateError, "Operation not legal in the current execution state.")                                         \
  ERR(ProcessError, "Spawning or controlling the debuggee failed.")                                              \
  ERR(SessionConflictError, "Another session or process occupies the slot.")                                    \
  ERR(PathViolationError, "Path resolves outside of the workspace root.")                                        \
  ERR(NotFoundError, "No such session or file.")                                                                  \
  ERR(InvalidArgument, "Request is missing fields or is malformed.")

ENUM_TYPE_METADATA(ErrorKind, FOR_EACH_ERROR_KIND, DEFAULT_ENUM, u8)

namespace cdpr {

// JSON-RPC "invalid request" code, used for client messages the relay can't forward.
static constexpr int kInvalidRequestCode = -32600;
// Generic server error code for relay-originated failures.
static constexpr int kServerErrorCode = -32000;

struct RelayError
{
  ErrorKind mKind;
  std::string mMessage;
  // Only meaningful for ProtocolError, where it carries the inspector's error code.
  int mCode{ kServerErrorCode };

  static RelayError
  Connection(std::string message) noexcept
  {
    return RelayError{ ErrorKind::ConnectionError, std::move(message) };
  }

  static RelayError
  Timeout(std::string message) noexcept
  {
    return RelayError{ ErrorKind::TimeoutError, std::move(message) };
  }

  static RelayError
  Protocol(int code, std::string message) noexcept
  {
    return RelayError{ ErrorKind::ProtocolError, std::move(message), code };
  }

  static RelayError
  State(std::string message) noexcept
  {
    return RelayError{ ErrorKind::StateError, std::move(message) };
  }

  static RelayError
  Process(std::string message) noexcept
  {
    return RelayError{ ErrorKind::ProcessError, std::move(message) };
  }

  static RelayError
  SessionConflict(std::string message) noexcept
  {
    return RelayError{ ErrorKind::SessionConflictError, std::move(message) };
  }

  static RelayError
  PathViolation(std::string message) noexcept
  {
    return RelayError{ ErrorKind::PathViolationError, std::move(message) };
  }

  static RelayError
  NotFound(std::string message) noexcept
  {
    return RelayError{ ErrorKind::NotFoundError, std::move(message) };
  }

  static RelayError
  Invalid(std::string message) noexcept
  {
    return RelayError{ ErrorKind::InvalidArgument, std::move(message) };
  }

  constexpr bool
  Is(ErrorKind kind) const noexcept
  {
    return mKind == kind;
  }

  operator std::unexpected<RelayError>() && noexcept { return std::unexpected<RelayError>(std::move(*this)); }
};

template <typename T> using RelayResult = std::expected<T, RelayError>;

} // namespace cdpr

template <> struct fmt::formatter<cdpr::RelayError> : public fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto
  format(const cdpr::RelayError &error, FormatContext &ctx) const
  {
    if (error.mKind == ErrorKind::ProtocolError) {
      return fmt::format_to(ctx.out(), "{} ({}): {}", error.mKind, error.mCode, error.mMessage);
    }
    return fmt::format_to(ctx.out(), "{}: {}", error.mKind, error.mMessage);
  }
};
