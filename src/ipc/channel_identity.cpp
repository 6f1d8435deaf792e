#include <daemux/crypto/hasher.h>
#include <daemux/ipc/channel_identity.h>

#include <cstdlib>
#include <fstream>
#include <string_view>

namespace daemux::ipc {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kEndpointIdLength = 32;

bool can_write_dir(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return false;
    auto marker = dir / ".daemux-writable";
    std::ofstream f(marker);
    if (!f.good())
        return false;
    f << "ok";
    f.close();
    fs::remove(marker, ec);
    return true;
}

} // namespace

std::string resolve_endpoint_id(const CommandIdentity& command) {
    auto hasher = crypto::createSHA256Hasher();
    hasher->update(command.path);
    for (const auto& arg : command.args) {
        hasher->update(std::string_view("\0", 1));
        hasher->update(arg);
    }
    return hasher->finalize().substr(0, kEndpointIdLength);
}

fs::path resolve_runtime_dir(const fs::path& configured) {
    if (!configured.empty())
        return configured;
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        fs::path dir(xdg);
        if (can_write_dir(dir))
            return dir;
    }
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec)
        return fs::path("/tmp");
    return tmp;
}

fs::path channel_path(const std::string& endpointId, const fs::path& runtimeDir) {
#ifdef _WIN32
    (void)runtimeDir;
    return fs::path("\\\\.\\pipe\\daemon-" + endpointId);
#else
    return runtimeDir / ("daemon-" + endpointId + ".sock");
#endif
}

fs::path resolve_channel_path(const CommandIdentity& command, const fs::path& runtimeDir) {
    return channel_path(resolve_endpoint_id(command), resolve_runtime_dir(runtimeDir));
}

} // namespace daemux::ipc
