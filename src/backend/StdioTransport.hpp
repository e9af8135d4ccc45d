// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <backend/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace modelmatch
{

/// @brief How to launch the backend bridge process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Added to (or overriding) the inherited environment.
    bool discardStderr = true;              ///< Keep the child's diagnostics off the terminal.
};

/// @brief Transport to a child process speaking newline-delimited JSON on stdin/stdout.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Spawns the process described by @p config.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace modelmatch
