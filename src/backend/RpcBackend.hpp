// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <backend/BackendService.hpp>
#include <backend/JsonRpc.hpp>
#include <backend/Transport.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace modelmatch
{

/// @brief Identity reported by the backend during the handshake.
struct BackendInfo
{
    std::string name;
    std::string version;
};

/// @brief BackendService speaking JSON-RPC 2.0 to a bridge process.
///
/// Requests are answered one at a time. Notifications that arrive while waiting for a
/// response are handled in between; `log` notifications end up in the application log.
class RpcBackend: public BackendService
{
  public:
    explicit RpcBackend(std::unique_ptr<Transport> transport);
    ~RpcBackend() override;

    RpcBackend(const RpcBackend&) = delete;
    RpcBackend& operator=(const RpcBackend&) = delete;

    /// @brief Performs the `initialize` handshake. Must succeed before any other call.
    [[nodiscard]] auto initialize() -> Result<BackendInfo>;

    [[nodiscard]] auto listFolders() -> Result<std::vector<Folder>> override;
    [[nodiscard]] auto listModels(std::set<std::int64_t> const& folderIds) -> Result<std::vector<Model>> override;
    [[nodiscard]] auto establishSession(std::string_view tenant) -> VoidResult override;
    [[nodiscard]] auto submitSearch(std::string_view query) -> VoidResult override;

    [[nodiscard]] auto info() const noexcept -> BackendInfo const& { return _info; }
    [[nodiscard]] auto isInitialized() const noexcept -> bool { return _initialized; }

  private:
    std::unique_ptr<Transport> _transport;
    BackendInfo _info;
    std::int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nullptr)
        -> Result<nlohmann::json>;
    void handleNotification(jsonrpc::Notification const& notification);
};

} // namespace modelmatch
