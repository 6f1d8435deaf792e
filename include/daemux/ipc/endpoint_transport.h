#pragma once

#include <daemux/core/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace daemux::ipc {

using local = boost::asio::local::stream_protocol;

// Maps an OS error onto the transport taxonomy:
// EADDRINUSE -> AddressInUse, ECONNREFUSED -> ConnectionRefused, ENOENT -> NotFound,
// EACCES/EPERM -> PermissionDenied, ENAMETOOLONG/ENOTDIR -> PathInvalid, else NetworkError.
ErrorCode classify_error(const boost::system::error_code& ec);

Error make_transport_error(const boost::system::error_code& ec, std::string_view operation,
                           const std::filesystem::path& path);

// A bound, listening channel. Closing stops accepting and removes the artifact if it is
// still the filesystem object this endpoint created.
class ListeningEndpoint {
public:
    ListeningEndpoint(local::acceptor acceptor, std::filesystem::path path, std::uint64_t device,
                      std::uint64_t inode);
    ~ListeningEndpoint();

    ListeningEndpoint(const ListeningEndpoint&) = delete;
    ListeningEndpoint& operator=(const ListeningEndpoint&) = delete;

    local::acceptor& acceptor() noexcept { return acceptor_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    bool is_open() const noexcept { return acceptor_.is_open(); }

    void close();

private:
    local::acceptor acceptor_;
    std::filesystem::path path_;
    std::uint64_t device_;
    std::uint64_t inode_;
    bool closed_ = false;
};

// Platform capability over the local byte-stream IPC primitive
class IEndpointTransport {
public:
    virtual ~IEndpointTransport() = default;

    // AddressInUse whenever an artifact exists at the path, live or stale
    virtual Result<std::unique_ptr<ListeningEndpoint>>
    listen(const boost::asio::any_io_executor& executor, const std::filesystem::path& path) = 0;

    // ConnectionRefused for a stale artifact, NotFound when nothing exists at the path
    virtual boost::asio::awaitable<Result<local::socket>>
    connect(const std::filesystem::path& path) = 0;

    // A missing artifact is success; any other failure propagates
    virtual Result<void> remove_artifact(const std::filesystem::path& path) = 0;
};

class UnixEndpointTransport : public IEndpointTransport {
public:
    explicit UnixEndpointTransport(Duration connectTimeout = Duration{2000})
        : connectTimeout_(connectTimeout) {}

    Result<std::unique_ptr<ListeningEndpoint>>
    listen(const boost::asio::any_io_executor& executor,
           const std::filesystem::path& path) override;
    boost::asio::awaitable<Result<local::socket>>
    connect(const std::filesystem::path& path) override;
    Result<void> remove_artifact(const std::filesystem::path& path) override;

private:
    Duration connectTimeout_;
};

std::unique_ptr<IEndpointTransport> make_platform_transport(Duration connectTimeout);

} // namespace daemux::ipc
