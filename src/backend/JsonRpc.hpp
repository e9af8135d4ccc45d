// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace modelmatch::jsonrpc
{

/// @brief The `error` member of a JSON-RPC 2.0 response.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief A JSON-RPC 2.0 response, successful or not.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief A message without id sent by the peer on its own initiative.
struct Notification
{
    std::string method;
    nlohmann::json params;
};

/// @brief Any message a client can receive.
using Message = std::variant<Response, Notification>;

/// @brief Builds a request message.
/// @param params Omitted from the message when null.
[[nodiscard]] auto makeRequest(std::int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a notification message (no id, no response expected).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Classifies and parses an incoming message.
/// @return The response or notification, or ProtocolError if it is neither.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

/// @brief Converts an RPC error into an application error.
///
/// Server-defined codes (-32000 to -32099 and anything outside the reserved range)
/// become BackendError; the reserved protocol codes become ProtocolError.
[[nodiscard]] auto toError(RpcError const& error) -> Error;

} // namespace modelmatch::jsonrpc
