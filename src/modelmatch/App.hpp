// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <modelmatch/Config.hpp>

#include <memory>

namespace modelmatch
{

/// @brief Wires the backend, the mode controller and the terminal together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Starts the backend process, performs the handshake and prepares the initial state.
    ///
    /// Does not touch the terminal.
    /// @return Success or the error that prevented the backend from starting.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive loop until the user quits.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace modelmatch
