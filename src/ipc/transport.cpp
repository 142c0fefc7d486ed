#include "transport.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include "codec.hpp"

namespace casement::ipc
{

namespace
{

bool fill_address(struct sockaddr_un& addr, const std::string& path)
{
    addr            = {};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
        return false;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

}   // namespace

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd) : fd_(fd) {}

Connection::~Connection()
{
    close();
}

Connection::Connection(Connection&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_       = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

bool Connection::read_exact(uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        auto n = ::read(fd_, buf + total, len - total);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;   // EOF or error
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::write_exact(const uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        auto n = ::send(fd_, buf + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::send(const Message& msg)
{
    if (fd_ < 0)
        return false;
    if (msg.payload.size() > MAX_PAYLOAD_SIZE)
        return false;
    auto wire = encode_message(msg);
    return write_exact(wire.data(), wire.size());
}

std::optional<Message> Connection::recv()
{
    if (fd_ < 0)
        return std::nullopt;

    // Read fixed header
    uint8_t hdr_buf[HEADER_SIZE];
    if (!read_exact(hdr_buf, HEADER_SIZE))
        return std::nullopt;

    auto hdr_opt = decode_header(std::span<const uint8_t>(hdr_buf, HEADER_SIZE));
    if (!hdr_opt)
        return std::nullopt;

    auto& hdr = *hdr_opt;
    if (hdr.payload_len > MAX_PAYLOAD_SIZE)
        return std::nullopt;

    Message msg;
    msg.header = hdr;
    msg.payload.resize(hdr.payload_len);

    if (hdr.payload_len > 0)
    {
        if (!read_exact(msg.payload.data(), hdr.payload_len))
            return std::nullopt;
    }

    return msg;
}

bool Connection::wait_readable(int timeout_ms) const
{
    if (fd_ < 0)
        return false;
    struct pollfd pfd
    {
    };
    pfd.fd     = fd_;
    pfd.events = POLLIN;
    int rc     = ::poll(&pfd, 1, timeout_ms);
    return rc > 0 && (pfd.revents & (POLLIN | POLLHUP)) != 0;
}

std::optional<uid_t> Connection::peer_uid() const
{
    if (fd_ < 0)
        return std::nullopt;
    struct ucred cred
    {
    };
    socklen_t len = sizeof(cred);
    if (::getsockopt(fd_, SOL_SOCKET, SO_PEERCRED, &cred, &len) < 0)
        return std::nullopt;
    return cred.uid;
}

void Connection::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

// ─── Server ──────────────────────────────────────────────────────────────────

Server::Server() : owner_uid_(::geteuid()) {}

Server::~Server()
{
    close();
}

bool Server::listen(const std::string& path)
{
    struct sockaddr_un addr
    {
    };
    if (!fill_address(addr, path))
        return false;

    if (Client::is_live(path))
        return false;
    ::unlink(path.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return false;

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        ::close(fd);
        return false;
    }

    if (::chmod(path.c_str(), 0600) < 0)
    {
        ::close(fd);
        ::unlink(path.c_str());
        return false;
    }

    if (::listen(fd, 8) < 0)
    {
        ::close(fd);
        ::unlink(path.c_str());
        return false;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0)
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    listen_fd_ = fd;
    path_      = path;
    return true;
}

std::unique_ptr<Connection> Server::try_accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    for (;;)
    {
        struct sockaddr_un client_addr
        {
        };
        socklen_t client_len = sizeof(client_addr);
        int       client_fd =
            ::accept4(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len, SOCK_CLOEXEC);
        if (client_fd < 0)
            return nullptr;   // EAGAIN or error, no pending connection

        // Accepted sockets stay blocking; the bridge polls before reading.
        auto conn = std::make_unique<Connection>(client_fd);
        auto uid  = conn->peer_uid();
        if (uid && *uid == owner_uid_)
            return conn;
        // Drop it and look at the next pending peer.
    }
}

void Server::close()
{
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!path_.empty())
    {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

// ─── Client ──────────────────────────────────────────────────────────────────

std::unique_ptr<Connection> Client::connect(const std::string& path)
{
    struct sockaddr_un addr
    {
    };
    if (!fill_address(addr, path))
        return nullptr;

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
        return nullptr;

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        ::close(fd);
        return nullptr;
    }

    return std::make_unique<Connection>(fd);
}

bool Client::is_live(const std::string& path)
{
    return connect(path) != nullptr;
}

// ─── Utility ─────────────────────────────────────────────────────────────────

std::string default_socket_path()
{
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && xdg[0] != '\0')
        return std::string(xdg) + "/casement.sock";

    return "/tmp/casement-" + std::to_string(::getuid()) + ".sock";
}

}   // namespace casement::ipc
