#include <daemux/ipc/endpoint_transport.h>

#include <spdlog/spdlog.h>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <cerrno>
#include <cstring>
#include <string>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#endif

namespace daemux::ipc {

namespace fs = std::filesystem;
using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace {

bool path_fits(const std::string& sp) {
#ifndef _WIN32
    return sp.size() < sizeof(sockaddr_un::sun_path);
#else
    (void)sp;
    return true;
#endif
}

Error path_too_long(const fs::path& path) {
    return Error{ErrorCode::PathInvalid,
                 "Channel path too long for a local socket: '" + path.string() + "'"};
}

void set_cloexec(int fd) {
#ifndef _WIN32
    int flags = ::fcntl(fd, F_GETFD);
    if (flags != -1) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
#else
    (void)fd;
#endif
}

} // namespace

ErrorCode classify_error(const boost::system::error_code& ec) {
    namespace errc = boost::system::errc;
    if (ec == boost::asio::error::address_in_use)
        return ErrorCode::AddressInUse;
    if (ec == boost::asio::error::connection_refused)
        return ErrorCode::ConnectionRefused;
    if (ec == errc::no_such_file_or_directory)
        return ErrorCode::NotFound;
    if (ec == errc::permission_denied || ec == errc::operation_not_permitted)
        return ErrorCode::PermissionDenied;
    if (ec == errc::filename_too_long || ec == errc::not_a_directory)
        return ErrorCode::PathInvalid;
    if (ec == boost::asio::error::timed_out)
        return ErrorCode::Timeout;
    return ErrorCode::NetworkError;
}

Error make_transport_error(const boost::system::error_code& ec, std::string_view operation,
                           const fs::path& path) {
    return Error{classify_error(ec),
                 std::string(operation) + " '" + path.string() + "' failed: " + ec.message()};
}

ListeningEndpoint::ListeningEndpoint(local::acceptor acceptor, fs::path path,
                                     std::uint64_t device, std::uint64_t inode)
    : acceptor_(std::move(acceptor)), path_(std::move(path)), device_(device), inode_(inode) {}

ListeningEndpoint::~ListeningEndpoint() {
    close();
}

void ListeningEndpoint::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    acceptor_.close(ec);

#ifndef _WIN32
    struct stat st {};
    if (::lstat(path_.c_str(), &st) != 0) {
        spdlog::debug("Channel artifact {} already gone", path_.string());
        return;
    }
    if (static_cast<std::uint64_t>(st.st_dev) != device_ ||
        static_cast<std::uint64_t>(st.st_ino) != inode_) {
        spdlog::warn("Channel artifact {} was replaced; leaving it in place", path_.string());
        return;
    }
#endif
    std::error_code rec;
    fs::remove(path_, rec);
    if (rec) {
        spdlog::warn("Failed to remove channel artifact {}: {}", path_.string(), rec.message());
    } else {
        spdlog::info("Stopped listening on {}", path_.string());
    }
}

Result<std::unique_ptr<ListeningEndpoint>>
UnixEndpointTransport::listen(const boost::asio::any_io_executor& executor, const fs::path& path) {
    const std::string sp = path.string();
    if (!path_fits(sp)) {
        return path_too_long(path);
    }

    if (auto parent = path.parent_path(); !parent.empty()) {
        std::error_code fec;
        if (!fs::exists(parent, fec)) {
            fs::create_directories(parent, fec);
            if (fec) {
                auto code = fec == std::errc::permission_denied ? ErrorCode::PermissionDenied
                                                                : ErrorCode::PathInvalid;
                return Error{code, "Cannot create runtime directory '" + parent.string() +
                                       "': " + fec.message()};
            }
            fs::permissions(parent, fs::perms::owner_all, fec);
        }
    }

    local::acceptor acceptor(executor);
    local::endpoint endpoint(sp);
    boost::system::error_code ec;
    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        return make_transport_error(ec, "open", path);
    }
    set_cloexec(acceptor.native_handle());

    // An existing artifact, live or stale, is AddressInUse. Stale ones are removed by
    // clients under the channel lock before they launch a daemon.
    acceptor.bind(endpoint, ec);
    if (ec) {
        return make_transport_error(ec, "bind", path);
    }

    acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        auto err = make_transport_error(ec, "listen", path);
        boost::system::error_code ignored;
        acceptor.close(ignored);
        if (auto removed = remove_artifact(path); !removed) {
            spdlog::warn("{}", removed.error().message);
        }
        return err;
    }

    std::error_code pec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, pec);
    if (pec) {
        spdlog::debug("Could not restrict permissions on {}: {}", sp, pec.message());
    }

    std::uint64_t device = 0;
    std::uint64_t inode = 0;
#ifndef _WIN32
    struct stat st {};
    if (::lstat(sp.c_str(), &st) != 0) {
        int err = errno;
        acceptor.close(ec);
        return Error{ErrorCode::IOError, "stat '" + sp + "' failed: " + std::strerror(err)};
    }
    device = static_cast<std::uint64_t>(st.st_dev);
    inode = static_cast<std::uint64_t>(st.st_ino);
#endif

    spdlog::info("Listening on {}", sp);
    return std::make_unique<ListeningEndpoint>(std::move(acceptor), path, device, inode);
}

awaitable<Result<local::socket>> UnixEndpointTransport::connect(const fs::path& path) {
    const std::string sp = path.string();
    if (!path_fits(sp)) {
        co_return path_too_long(path);
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto socket = std::make_shared<local::socket>(executor);
    auto timedOut = std::make_shared<bool>(false);

    boost::asio::steady_timer timer(executor);
    timer.expires_after(connectTimeout_);
    timer.async_wait([socket, timedOut](const boost::system::error_code& ec) {
        if (!ec) {
            *timedOut = true;
            boost::system::error_code ignored;
            socket->close(ignored);
        }
    });

    boost::system::error_code ec;
    co_await socket->async_connect(local::endpoint(sp),
                                   boost::asio::redirect_error(use_awaitable, ec));
    timer.cancel();

    if (*timedOut) {
        co_return Error{ErrorCode::Timeout, "Connection timeout (channel='" + sp + "')"};
    }
    if (ec) {
        spdlog::debug("connect {} -> {}", sp, ec.message());
        co_return make_transport_error(ec, "connect", path);
    }
    set_cloexec(socket->native_handle());
    co_return std::move(*socket);
}

Result<void> UnixEndpointTransport::remove_artifact(const fs::path& path) {
#ifndef _WIN32
    if (::unlink(path.c_str()) == 0) {
        spdlog::info("Removed stale channel artifact {}", path.string());
        return Result<void>();
    }
    int err = errno;
    if (err == ENOENT) {
        return Result<void>();
    }
    return make_transport_error(boost::system::error_code(err, boost::system::system_category()),
                                "remove", path);
#else
    (void)path;
    return Result<void>();
#endif
}

std::unique_ptr<IEndpointTransport> make_platform_transport(Duration connectTimeout) {
    return std::make_unique<UnixEndpointTransport>(connectTimeout);
}

} // namespace daemux::ipc
