/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <common/typedefs.h>

// nlohmann
#include <nlohmann/json.hpp>

// stdlib
#include <optional>
#include <string>
#include <string_view>

namespace cdpr {
using Json = nlohmann::json;
}

#define FOR_EACH_MESSAGE_KIND(KIND)                                                                               \
  KIND(Invalid, "Not a DevTools protocol message")                                                                \
  KIND(Request, "{id, method, params?}")                                                                          \
  KIND(Response, "{id, result}")                                                                                  \
  KIND(ErrorResponse, "{id, error: {code, message}}")                                                             \
  KIND(Event, "{method, params?}")

ENUM_TYPE_METADATA(MessageKind, FOR_EACH_MESSAGE_KIND, DEFAULT_ENUM, u8)

namespace cdpr::cdp {

// Lifecycle notifications the relay itself publishes. Not part of the inspector protocol.
static constexpr std::string_view kProxyReady = "Proxy.ready";
static constexpr std::string_view kProxyClosed = "Proxy.closed";
static constexpr std::string_view kWebSocketOpen = "WebSocket.open";
static constexpr std::string_view kWebSocketClose = "WebSocket.close";
static constexpr std::string_view kWebSocketError = "WebSocket.error";

static constexpr std::string_view kNoActiveSession = "No active session";

// Wire constructors. `params` is left out of requests and events when it's null or an empty object.
Json MakeRequest(MessageId id, std::string_view method, const Json &params) noexcept;
Json MakeResponse(const Json &id, Json result) noexcept;
Json MakeErrorResponse(const Json &id, int code, std::string_view message) noexcept;
Json MakeEvent(std::string_view method, Json params) noexcept;

// Parses one text frame. Anything that isn't valid JSON yields nothing.
std::optional<Json> ParseMessage(std::string_view text) noexcept;

MessageKind Classify(const Json &message) noexcept;

// Turns an inspector `{code, message}` error object into a ProtocolError.
RelayError ToRelayError(const Json &error) noexcept;

} // namespace cdpr::cdp
