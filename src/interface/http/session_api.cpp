/** LICENSE TEMPLATE */
#include "session_api.h"

// cdpr
#include <common/error.h>
#include <session/session_registry.h>
#include <utils/logger.h>
#include <utils/util.h>

namespace cdpr::http {

static constexpr std::string_view kNoActiveSession = "No active session";
static constexpr std::string_view kNoSessionRunning = "No debug session is currently running";

SessionApi::SessionApi(SessionRegistry &registry) noexcept : mRegistry(registry) {}

/* static */
ApiResponse
SessionApi::ErrorResponse(u32 status, std::string_view error, std::string_view message) noexcept
{
  Json body{ { "error", error } };
  if (!message.empty()) {
    body["message"] = message;
  }
  return ApiResponse{ .mStatus = status, .mBody = std::move(body) };
}

/* static */
ApiResponse
SessionApi::StartFailure(const RelayError &error) noexcept
{
  switch (error.mKind) {
  case ErrorKind::PathViolationError:
    return ErrorResponse(403, "Forbidden", error.mMessage);
  case ErrorKind::InvalidArgument:
    return ErrorResponse(400, "Bad request", error.mMessage);
  default:
    return ErrorResponse(500, "Failed to start session", error.mMessage);
  }
}

void
SessionApi::Handle(const ApiRequest &request, Responder respond) noexcept
{
  std::string_view path{ request.mTarget };
  if (const auto query = path.find('?'); query != std::string_view::npos) {
    path = path.substr(0, query);
  }
  const auto segments = SplitString(path, '/');
  DBGLOG(http, "{} {}", request.mMethod, request.mTarget);

  const bool underDebug = !segments.empty() && segments[0] == "debug";
  if (underDebug && segments.size() == 2 && segments[1] == "session") {
    if (request.mMethod == "POST") {
      StartSession(request, std::move(respond));
      return;
    }
    if (request.mMethod == "GET") {
      GetCurrentSession(respond);
      return;
    }
    if (request.mMethod == "DELETE") {
      StopSession(std::nullopt, std::move(respond));
      return;
    }
  } else if (underDebug && segments.size() == 3 && segments[1] == "session") {
    if (request.mMethod == "GET") {
      GetSession(segments[2], respond);
      return;
    }
    if (request.mMethod == "DELETE") {
      StopSession(std::string{ segments[2] }, std::move(respond));
      return;
    }
  } else if (underDebug && segments.size() == 2 && segments[1] == "sessions" && request.mMethod == "GET") {
    ListSessions(respond);
    return;
  }

  respond(ErrorResponse(404, "Not found", {}));
}

void
SessionApi::StartSession(const ApiRequest &request, Responder respond) noexcept
{
  const auto body = Json::parse(request.mBody, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("file") || !body["file"].is_string() ||
      body["file"].get<std::string>().empty()) {
    respond(ErrorResponse(400, "Bad request", "Missing required field: file"));
    return;
  }

  StartOptions options{};
  if (const auto it = body.find("breakOnStart"); it != body.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      respond(ErrorResponse(400, "Bad request", "Field breakOnStart must be a boolean"));
      return;
    }
    options.mBreakOnStart = it->get<bool>();
  }

  mRegistry.Start(body["file"].get<std::string>(), options, [respond = std::move(respond)](auto result) {
    if (!result) {
      DBGLOG(http, "session start failed: {}", result.error());
      respond(StartFailure(result.error()));
      return;
    }
    respond(ApiResponse{ .mStatus = 201, .mBody = Json{ { "success", true }, { "session", result->ToJson() } } });
  });
}

void
SessionApi::StopSession(std::optional<std::string> sessionId, Responder respond) noexcept
{
  const bool current = !sessionId.has_value();
  mRegistry.Stop(std::move(sessionId), [current, respond = std::move(respond)](auto result) {
    if (!result) {
      if (result.error().Is(ErrorKind::NotFoundError)) {
        respond(current ? ErrorResponse(404, kNoActiveSession, kNoSessionRunning)
                        : ErrorResponse(404, "Session not found", result.error().mMessage));
        return;
      }
      respond(ErrorResponse(500, "Failed to stop session", result.error().mMessage));
      return;
    }
    respond(ApiResponse{ .mStatus = 200,
      .mBody = Json{ { "success", true }, { "sessionId", result->mSessionId }, { "status", "stopped" } } });
  });
}

void
SessionApi::GetCurrentSession(const Responder &respond) const noexcept
{
  if (auto session = mRegistry.Current(); session) {
    respond(ApiResponse{ .mStatus = 200, .mBody = session->ToJson() });
    return;
  }
  respond(ErrorResponse(404, kNoActiveSession, kNoSessionRunning));
}

void
SessionApi::GetSession(std::string_view sessionId, const Responder &respond) const noexcept
{
  if (auto session = mRegistry.Find(sessionId); session) {
    respond(ApiResponse{ .mStatus = 200, .mBody = session->ToJson() });
    return;
  }
  respond(ErrorResponse(404, "Session not found", fmt::format("Session not found: {}", sessionId)));
}

void
SessionApi::ListSessions(const Responder &respond) const noexcept
{
  Json sessions = Json::array();
  for (const auto &session : mRegistry.List()) {
    sessions.push_back(session.ToJson());
  }
  respond(ApiResponse{ .mStatus = 200, .mBody = Json{ { "sessions", std::move(sessions) } } });
}

} // namespace cdpr::http
