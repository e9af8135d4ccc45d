// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>
#include <utility>

namespace modelmatch::jsonrpc
{

namespace
{
    auto makeMessage(std::string_view method, nlohmann::json params) -> nlohmann::json
    {
        auto msg = nlohmann::json {
            { "jsonrpc", "2.0" },
            { "method", method },
        };
        if (!params.is_null())
            msg["params"] = std::move(params);
        return msg;
    }
} // namespace

auto makeRequest(std::int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = makeMessage(method, std::move(params));
    msg["id"] = id;
    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return makeMessage(method, std::move(params));
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || json::getStringOr(message, "jsonrpc", "") != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (message.contains("result"))
        return Response { .id = message.value("id", nlohmann::json {}), .result = message["result"] };

    if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");

        auto code = json::getInt64(err, "code");
        if (!code)
            return std::unexpected(code.error());
        auto errorMessage = json::getString(err, "message");
        if (!errorMessage)
            return std::unexpected(errorMessage.error());

        return Response {
            .id = message.value("id", nlohmann::json {}),
            .error =
                RpcError {
                    .code = static_cast<int>(*code),
                    .message = std::move(*errorMessage),
                    .data = err.value("data", nlohmann::json {}),
                },
        };
    }

    if (message.contains("method") && message["method"].is_string() && !message.contains("id"))
        return Notification {
            .method = message["method"].get<std::string>(),
            .params = message.value("params", nlohmann::json::object()),
        };

    return makeError(ErrorCode::ProtocolError, "JSON-RPC message is neither a response nor a notification");
}

auto toError(RpcError const& error) -> Error
{
    auto const reserved = error.code >= -32768 && error.code <= -32100;
    return Error {
        .code = reserved ? ErrorCode::ProtocolError : ErrorCode::BackendError,
        .message = std::format("RPC error {}: {}", error.code, error.message),
    };
}

} // namespace modelmatch::jsonrpc
