#pragma once

#include "message.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace casement::ipc
{

// ─── Connection ──────────────────────────────────────────────────────────────
// Wraps a connected socket fd. Provides send/recv of framed Messages.
// Not thread-safe; the caller synchronizes.

class Connection
{
   public:
    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // Returns true if the underlying fd is valid.
    bool is_open() const { return fd_ >= 0; }

    // Send a complete message. Returns true on success. A peer that went
    // away yields false, never SIGPIPE.
    bool send(const Message& msg);

    // Receive a complete message (blocking).
    // Returns std::nullopt on error or connection closed.
    std::optional<Message> recv();

    // Wait up to `timeout_ms` for data. Returns false on timeout or error.
    bool wait_readable(int timeout_ms) const;

    // Close the connection.
    void close();

    int fd() const { return fd_; }

    // Uid of the process on the other end, from the kernel's socket
    // credentials. std::nullopt if the fd is closed or the query fails.
    std::optional<uid_t> peer_uid() const;

   private:
    int fd_ = -1;

    // Internal: read exactly `len` bytes into `buf`. Returns false on error/EOF.
    bool read_exact(uint8_t* buf, size_t len);
    // Internal: write exactly `len` bytes from `buf`. Returns false on error.
    bool write_exact(const uint8_t* buf, size_t len);
};

// ─── Server ──────────────────────────────────────────────────────────────────
// Listens on the shell's Unix domain socket. Only processes of the same user
// get a Connection.

class Server
{
   public:
    Server();
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Bind and listen on the given socket path, owner-only.
    // A leftover file from a dead shell is replaced. Returns false if
    // another shell still answers on `path`.
    bool listen(const std::string& path);

    // Accept a new connection (non-blocking).
    // Returns nullptr immediately if no pending connection. Peers running
    // as another user are closed and skipped.
    std::unique_ptr<Connection> try_accept();

    // Close the listening socket and remove the socket file.
    void close();

    bool               is_listening() const { return listen_fd_ >= 0; }
    int                listen_fd() const { return listen_fd_; }
    const std::string& path() const { return path_; }

   private:
    int         listen_fd_ = -1;
    std::string path_;
    uid_t       owner_uid_;
};

// ─── Client ──────────────────────────────────────────────────────────────────
// Connects to a Unix domain socket server.

class Client
{
   public:
    // Connect to the server at the given socket path.
    // Returns a Connection on success, nullptr on failure.
    static std::unique_ptr<Connection> connect(const std::string& path);

    // True if a server accepts connections on `path` right now.
    static bool is_live(const std::string& path);
};

// ─── Utility ─────────────────────────────────────────────────────────────────

// Returns the per-user socket path shared by every shell instance:
//   $XDG_RUNTIME_DIR/casement.sock
// Falls back to /tmp/casement-<uid>.sock if XDG_RUNTIME_DIR is not set.
std::string default_socket_path();

}   // namespace casement::ipc
