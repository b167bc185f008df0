/** LICENSE TEMPLATE */
#include "protocol.h"

// fmt
#include <fmt/format.h>

namespace cdpr::cdp {

static bool
HasParams(const Json &params) noexcept
{
  return !params.is_null() && !(params.is_object() && params.empty());
}

Json
MakeRequest(MessageId id, std::string_view method, const Json &params) noexcept
{
  Json request = { { "id", id }, { "method", method } };
  if (HasParams(params)) {
    request["params"] = params;
  }
  return request;
}

Json
MakeResponse(const Json &id, Json result) noexcept
{
  return Json{ { "id", id }, { "result", std::move(result) } };
}

Json
MakeErrorResponse(const Json &id, int code, std::string_view message) noexcept
{
  return Json{ { "id", id }, { "error", { { "code", code }, { "message", message } } } };
}

Json
MakeEvent(std::string_view method, Json params) noexcept
{
  Json event = { { "method", method } };
  event["params"] = params.is_null() ? Json::object() : std::move(params);
  return event;
}

std::optional<Json>
ParseMessage(std::string_view text) noexcept
{
  auto parsed = Json::parse(text, nullptr, /* allow_exceptions */ false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

MessageKind
Classify(const Json &message) noexcept
{
  if (!message.is_object()) {
    return MessageKind::Invalid;
  }
  const auto id = message.find("id");
  const auto method = message.find("method");
  const bool hasId = id != message.end() && id->is_number_integer();
  const bool hasMethod = method != message.end() && method->is_string();

  if (hasId && hasMethod) {
    return MessageKind::Request;
  }
  if (hasId && message.contains("error")) {
    return MessageKind::ErrorResponse;
  }
  if (hasId) {
    return MessageKind::Response;
  }
  if (hasMethod) {
    return MessageKind::Event;
  }
  return MessageKind::Invalid;
}

RelayError
ToRelayError(const Json &error) noexcept
{
  int code = kServerErrorCode;
  std::string message = "Unknown protocol error";
  if (error.is_object()) {
    if (auto it = error.find("code"); it != error.end() && it->is_number_integer()) {
      code = it->get<int>();
    }
    if (auto it = error.find("message"); it != error.end() && it->is_string()) {
      message = it->get<std::string>();
    }
    if (auto it = error.find("data"); it != error.end() && it->is_string()) {
      message = fmt::format("{} ({})", message, it->get<std::string>());
    }
  }
  return RelayError::Protocol(code, std::move(message));
}

} // namespace cdpr::cdp
