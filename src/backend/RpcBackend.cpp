// SPDX-License-Identifier: Apache-2.0
#include "RpcBackend.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace modelmatch
{

namespace
{
    constexpr auto ProtocolVersion = std::string_view { "1" };

    auto parseFolder(nlohmann::json const& entry) -> Result<Folder>
    {
        auto id = json::getInt64(entry, "id");
        if (!id)
            return std::unexpected(id.error());
        return json::getString(entry, "name").transform([&](std::string name) {
            return Folder { .id = *id, .name = std::move(name) };
        });
    }

    auto parseModel(nlohmann::json const& entry) -> Result<Model>
    {
        auto uuid = json::getString(entry, "uuid");
        if (!uuid)
            return std::unexpected(uuid.error());
        auto name = json::getString(entry, "name");
        if (!name)
            return std::unexpected(name.error());
        auto const stateName = json::getStringOr(entry, "state", "");
        auto const state = modelStateFromString(stateName);
        if (!state)
            return makeError(ErrorCode::ProtocolError,
                             std::format("Unknown state '{}' for model {}", stateName, *uuid));
        return Model { .uuid = std::move(*uuid), .name = std::move(*name), .state = *state };
    }

    /// Parses every element of `result[key]` with `parse`, failing on the first bad one.
    template <typename T, typename Parser>
    auto parseList(nlohmann::json const& result, std::string_view key, Parser parse) -> Result<std::vector<T>>
    {
        return json::getArray(result, key).and_then([&](nlohmann::json const* array) -> Result<std::vector<T>> {
            auto items = std::vector<T> {};
            items.reserve(array->size());
            for (auto const& entry: *array)
            {
                auto item = parse(entry);
                if (!item)
                    return std::unexpected(item.error());
                items.push_back(std::move(*item));
            }
            return items;
        });
    }
} // namespace

RpcBackend::RpcBackend(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

RpcBackend::~RpcBackend()
{
    if (_transport)
        _transport->close();
}

auto RpcBackend::initialize() -> Result<BackendInfo>
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "clientInfo",
          nlohmann::json {
              { "name", "modelmatch" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params)).and_then([this](nlohmann::json const& result) -> Result<BackendInfo> {
        if (!result.is_object())
            return makeError(ErrorCode::ProtocolError, "Backend sent a malformed initialize result");
        auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
        _info.name = json::getStringOr(serverInfo, "name", "unknown");
        _info.version = json::getStringOr(serverInfo, "version", "unknown");

        if (auto sent = _transport->send(jsonrpc::makeNotification("initialized")); !sent)
            return std::unexpected(sent.error());

        _initialized = true;
        log::info("Backend initialized: {} v{}", _info.name, _info.version);
        return _info;
    });
}

auto RpcBackend::listFolders() -> Result<std::vector<Folder>>
{
    return sendRequest("folders/list").and_then([](nlohmann::json const& result) {
        return parseList<Folder>(result, "folders", parseFolder);
    });
}

auto RpcBackend::listModels(std::set<std::int64_t> const& folderIds) -> Result<std::vector<Model>>
{
    auto params = nlohmann::json { { "folderIds", folderIds } };
    return sendRequest("models/list", std::move(params)).and_then([](nlohmann::json const& result) {
        return parseList<Model>(result, "models", parseModel);
    });
}

auto RpcBackend::establishSession(std::string_view tenant) -> VoidResult
{
    auto const params = nlohmann::json { { "tenant", tenant } };
    return sendRequest("session/invalidate", params)
        .and_then([&](nlohmann::json const&) { return sendRequest("session/establish", params); })
        .transform([&](nlohmann::json const&) { log::info("Session established for tenant '{}'", tenant); });
}

auto RpcBackend::submitSearch(std::string_view query) -> VoidResult
{
    return sendRequest("search/submit", nlohmann::json { { "query", query } })
        .transform([&](nlohmann::json const& result) {
            if (auto const it = result.find("matches"); it != result.end() && it->is_number_integer())
                log::info("Search for \"{}\" matched {} model(s)", query, it->get<std::int64_t>());
        });
}

auto RpcBackend::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    if (!_initialized && method != "initialize")
        return makeError(ErrorCode::ProtocolError, "Backend not initialized");

    auto const id = _nextId++;
    if (auto sent = _transport->send(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
        return std::unexpected(sent.error());

    while (true)
    {
        auto message = _transport->receive().and_then(
            [](nlohmann::json const& raw) { return jsonrpc::parseMessage(raw); });
        if (!message)
            return std::unexpected(message.error());

        if (auto const* notification = std::get_if<jsonrpc::Notification>(&*message))
        {
            handleNotification(*notification);
            continue;
        }

        auto const& response = std::get<jsonrpc::Response>(*message);
        if (response.id != id)
        {
            log::warning("Ignoring backend response with unexpected id {} (waiting for {})", response.id.dump(), id);
            continue;
        }
        if (response.error)
            return std::unexpected(jsonrpc::toError(*response.error));
        return response.result.value_or(nlohmann::json::object());
    }
}

void RpcBackend::handleNotification(jsonrpc::Notification const& notification)
{
    if (notification.method != "log")
    {
        log::debug("Ignoring backend notification '{}'", notification.method);
        return;
    }

    auto const level = log::parseLevel(json::getStringOr(notification.params, "level", "info"));
    log::write(level.value_or(log::Level::Info),
               std::format("backend: {}", json::getStringOr(notification.params, "message", "")));
}

} // namespace modelmatch
