// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace modelmatch
{

/// @brief A bidirectional channel carrying one JSON document per message.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends one message to the peer.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Blocks until the next complete message from the peer arrives.
    /// @return The message, or TransportError once the peer has gone away.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace modelmatch
