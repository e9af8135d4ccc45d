// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace modelmatch
{

namespace
{
    auto transportError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::TransportError, std::move(message));
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    bool connected = false;
    std::string command;
    std::string readBuffer;

    void closeDescriptors()
    {
        for (auto* fd: { &stdinWrite, &stdoutRead })
        {
            if (*fd >= 0)
            {
                ::close(*fd);
                *fd = -1;
            }
        }
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return transportError("Transport already connected");
    if (config.command.empty())
        return transportError("No backend command configured");

    int stdinPipe[2];
    int stdoutPipe[2];
    if (pipe2(stdinPipe, O_CLOEXEC) != 0)
        return transportError(std::format("Failed to create stdin pipe: {}", std::strerror(errno)));
    if (pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return transportError(std::format("Failed to create stdout pipe: {}", std::strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    if (config.discardStderr)
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    auto argStorage = std::vector<std::string> { config.command };
    argStorage.insert(argStorage.end(), config.args.begin(), config.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStorage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStorage = std::vector<std::string> {};
    for (auto** e = environ; e != nullptr && *e != nullptr; ++e)
    {
        auto entry = std::string_view(*e);
        auto const name = entry.substr(0, entry.find('='));
        if (!config.env.contains(std::string(name)))
            envStorage.emplace_back(entry);
    }
    for (auto const& [key, value]: config.env)
        envStorage.push_back(std::format("{}={}", key, value));
    auto envp = std::vector<char*> {};
    for (auto& entry: envStorage)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    auto pid = pid_t {};
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return transportError(
            std::format("Failed to spawn backend '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->command = config.command;
    _impl->readBuffer.clear();
    _impl->connected = true;
    log::info("Backend process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return transportError("Transport not connected");

    auto const data = message.dump() + "\n";
    auto remaining = std::string_view(data);
    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite, remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return transportError(std::format("Failed to write to backend: {}", std::strerror(errno)));
        }
        remaining.remove_prefix(static_cast<std::size_t>(written));
    }
    log::trace("-> {}", message.dump());
    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return transportError("Transport not connected");

    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);
            if (line.empty() || line == "\r")
                continue;
            log::trace("<- {}", line);
            return json::parse(line);
        }

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return transportError(std::format("Backend '{}' closed its output", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    if (_impl->childPid <= 0 && _impl->stdinWrite < 0 && _impl->stdoutRead < 0)
        return;

    _impl->connected = false;
    _impl->closeDescriptors();

    if (_impl->childPid > 0)
    {
        kill(_impl->childPid, SIGTERM);
        auto status = 0;
        while (waitpid(_impl->childPid, &status, 0) < 0 && errno == EINTR)
            ;
        _impl->childPid = -1;
    }

    log::debug("Backend transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace modelmatch
