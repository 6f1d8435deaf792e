#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace daemux::ipc {

// Executable path plus ordered arguments; the only input to endpoint naming
struct CommandIdentity {
    std::string path;
    std::vector<std::string> args;

    bool operator==(const CommandIdentity&) const = default;
};

// First 32 hex digits of SHA-256(path, then "\0" + arg for each argument).
// Deterministic across processes; the NUL separator keeps {"a,b"} and {"a","b"} apart.
std::string resolve_endpoint_id(const CommandIdentity& command);

// Configured directory if non-empty, else $XDG_RUNTIME_DIR when writable, else the temp dir
std::filesystem::path resolve_runtime_dir(const std::filesystem::path& configured = {});

// <runtimeDir>/daemon-<id>.sock, or \\.\pipe\daemon-<id> on Windows
std::filesystem::path channel_path(const std::string& endpointId,
                                   const std::filesystem::path& runtimeDir);

std::filesystem::path resolve_channel_path(const CommandIdentity& command,
                                           const std::filesystem::path& runtimeDir = {});

} // namespace daemux::ipc
