/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/macros.h>
#include <common/typedefs.h>
#include <interface/cdp/protocol.h>

// stdlib
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cdpr {

class SessionRegistry;
struct RelayError;

namespace http {

struct ApiRequest
{
  // Upper case, as on the wire.
  std::string mMethod;
  std::string mTarget;
  std::string mBody;
};

struct ApiResponse
{
  u32 mStatus;
  Json mBody;
};

using Responder = std::function<void(ApiResponse)>;

// Maps the `/debug/session...` REST routes onto the session registry. Runs on the reactor; `respond` is called
// exactly once, possibly after the call returns.
class SessionApi
{
  SessionRegistry &mRegistry;

  void StartSession(const ApiRequest &request, Responder respond) noexcept;
  void StopSession(std::optional<std::string> sessionId, Responder respond) noexcept;
  void GetCurrentSession(const Responder &respond) const noexcept;
  void GetSession(std::string_view sessionId, const Responder &respond) const noexcept;
  void ListSessions(const Responder &respond) const noexcept;

public:
  NO_COPY(SessionApi);
  explicit SessionApi(SessionRegistry &registry) noexcept;

  void Handle(const ApiRequest &request, Responder respond) noexcept;

  static ApiResponse ErrorResponse(u32 status, std::string_view error, std::string_view message) noexcept;
  // Picks the status for a failed session start.
  static ApiResponse StartFailure(const RelayError &error) noexcept;
};

} // namespace http
} // namespace cdpr
