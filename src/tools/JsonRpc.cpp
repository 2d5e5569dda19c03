// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

namespace toolchat::jsonrpc
{

namespace
{

    auto envelope(std::string_view method, nlohmann::json params) -> nlohmann::json
    {
        auto msg = nlohmann::json { { "jsonrpc", "2.0" }, { "method", method } };
        if (!params.is_null())
            msg["params"] = std::move(params);
        return msg;
    }

} // namespace

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = envelope(method, std::move(params));
    msg["id"] = id;
    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return envelope(method, std::move(params));
}

auto parseMessage(const nlohmann::json& value) -> Result<Message>
{
    if (json::getStringOr(value, "jsonrpc", "") != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto message = Message {
        .id = value.value("id", nlohmann::json {}),
        .method = json::getStringOr(value, "method", ""),
        .params = value.value("params", nlohmann::json {}),
        .result = std::nullopt,
        .error = std::nullopt,
    };

    if (!message.method.empty())
        return message;

    if (value.contains("result"))
        message.result = value["result"];
    else if (value.contains("error") && value["error"].is_object())
    {
        auto const& err = value["error"];
        message.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");

    return message;
}

} // namespace toolchat::jsonrpc
