#include <gtest/gtest.h>

#include "ipc/codec.hpp"
#include "ipc/transport.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <poll.h>
#include <string>
#include <unistd.h>

using namespace casement::ipc;

namespace
{

std::string test_socket_path(const std::string& tag)
{
    return (std::filesystem::temp_directory_path()
            / ("casement-test-" + tag + "-" + std::to_string(::getpid()) + ".sock"))
        .string();
}

// The listener is non-blocking; wait for the pending connection first.
std::unique_ptr<Connection> accept_one(Server& server)
{
    struct pollfd pfd
    {
    };
    pfd.fd     = server.listen_fd();
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, 1000) <= 0)
        return nullptr;
    return server.try_accept();
}

class ScopedEnv
{
   public:
    ScopedEnv(const char* name, const char* value) : name_(name)
    {
        if (const char* old = std::getenv(name))
            old_ = old;
        if (value)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
    }
    ~ScopedEnv()
    {
        if (old_)
            ::setenv(name_.c_str(), old_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }

   private:
    std::string                name_;
    std::optional<std::string> old_;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Socket path
// ═══════════════════════════════════════════════════════════════════════════════

TEST(IpcTransport, SocketPathUnderRuntimeDir)
{
    ScopedEnv env("XDG_RUNTIME_DIR", "/run/user/1000");
    EXPECT_EQ(default_socket_path(), "/run/user/1000/casement.sock");
}

TEST(IpcTransport, SocketPathFallsBackToTmp)
{
    ScopedEnv env("XDG_RUNTIME_DIR", nullptr);
    EXPECT_EQ(default_socket_path(), "/tmp/casement-" + std::to_string(::getuid()) + ".sock");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════════════════════════════════════

TEST(IpcTransport, ServerListenAndClose)
{
    auto   path = test_socket_path("listen");
    Server server;
    ASSERT_TRUE(server.listen(path));
    EXPECT_TRUE(server.is_listening());
    EXPECT_EQ(server.path(), path);
    EXPECT_TRUE(std::filesystem::exists(path));

    server.close();
    EXPECT_FALSE(server.is_listening());
    EXPECT_FALSE(std::filesystem::exists(path));

    server.close();   // second close is harmless
}

TEST(IpcTransport, ServerReplacesStaleSocketFile)
{
    // Left behind by a shell that crashed
    auto path = test_socket_path("stale");
    std::ofstream(path) << "stale";
    ASSERT_TRUE(std::filesystem::exists(path));

    Server server;
    EXPECT_TRUE(server.listen(path));
    EXPECT_TRUE(std::filesystem::is_socket(path));
}

TEST(IpcTransport, ListenRefusesWhileAnotherServerAnswers)
{
    auto   path = test_socket_path("live");
    Server first;
    ASSERT_TRUE(first.listen(path));
    EXPECT_TRUE(Client::is_live(path));

    Server second;
    EXPECT_FALSE(second.listen(path));
    EXPECT_FALSE(second.is_listening());
    EXPECT_TRUE(std::filesystem::is_socket(path));

    first.close();
    EXPECT_FALSE(Client::is_live(path));
    EXPECT_TRUE(second.listen(path));
}

TEST(IpcTransport, SocketFileIsOwnerOnly)
{
    auto   path = test_socket_path("perms");
    Server server;
    ASSERT_TRUE(server.listen(path));

    auto perms = std::filesystem::status(path).permissions();
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);
    EXPECT_NE(perms & std::filesystem::perms::owner_write, std::filesystem::perms::none);
}

TEST(IpcTransport, ListenRejectsOverlongPath)
{
    Server server;
    EXPECT_FALSE(server.listen("/tmp/" + std::string(200, 'x') + ".sock"));
    EXPECT_FALSE(server.listen(""));
    EXPECT_FALSE(server.is_listening());
}

TEST(IpcTransport, TryAcceptWithNothingPending)
{
    auto   path = test_socket_path("idle");
    Server server;
    ASSERT_TRUE(server.listen(path));
    EXPECT_EQ(server.try_accept(), nullptr);

    Server closed;
    EXPECT_EQ(closed.try_accept(), nullptr);
}

TEST(IpcTransport, ClientConnectRefused)
{
    EXPECT_EQ(Client::connect(test_socket_path("nobody")), nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════════

TEST(IpcTransport, SendRecvBothWays)
{
    auto   path = test_socket_path("sr");
    Server server;
    ASSERT_TRUE(server.listen(path));

    auto client_conn = Client::connect(path);
    ASSERT_NE(client_conn, nullptr);
    auto server_conn = accept_one(server);
    ASSERT_NE(server_conn, nullptr);

    Message hello;
    hello.header.type       = MessageType::HELLO;
    hello.header.seq        = 1;
    hello.header.request_id = 11;
    hello.payload           = encode_hello({PROTOCOL_MAJOR, PROTOCOL_MINOR, "main", "test"});
    ASSERT_TRUE(client_conn->send(hello));

    EXPECT_TRUE(server_conn->wait_readable(1000));
    auto received = server_conn->recv();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->header.type, MessageType::HELLO);
    EXPECT_EQ(received->header.request_id, 11u);
    auto decoded_hello = decode_hello(received->payload);
    ASSERT_TRUE(decoded_hello.has_value());
    EXPECT_EQ(decoded_hello->role, "main");

    Message welcome;
    welcome.header.type      = MessageType::WELCOME;
    welcome.header.window_id = 7;
    welcome.payload          = encode_welcome({42, 7, "https://gemini.google.com/app", 1.1});
    ASSERT_TRUE(server_conn->send(welcome));

    auto reply = client_conn->recv();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->header.type, MessageType::WELCOME);
    EXPECT_EQ(reply->header.window_id, 7u);
    auto decoded_welcome = decode_welcome(reply->payload);
    ASSERT_TRUE(decoded_welcome.has_value());
    EXPECT_EQ(decoded_welcome->url, "https://gemini.google.com/app");
}

TEST(IpcTransport, EmptyPayloadMessage)
{
    auto   path = test_socket_path("empty");
    Server server;
    ASSERT_TRUE(server.listen(path));
    auto client_conn = Client::connect(path);
    ASSERT_NE(client_conn, nullptr);
    auto server_conn = accept_one(server);
    ASSERT_NE(server_conn, nullptr);

    Message msg;
    msg.header.type = MessageType::EVT_BLUR;
    ASSERT_TRUE(client_conn->send(msg));

    auto received = server_conn->recv();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->header.type, MessageType::EVT_BLUR);
    EXPECT_TRUE(received->payload.empty());
}

TEST(IpcTransport, PeerCloseEndsRecv)
{
    auto   path = test_socket_path("peer");
    Server server;
    ASSERT_TRUE(server.listen(path));
    auto client_conn = Client::connect(path);
    ASSERT_NE(client_conn, nullptr);
    auto server_conn = accept_one(server);
    ASSERT_NE(server_conn, nullptr);

    client_conn->close();
    EXPECT_FALSE(client_conn->is_open());

    EXPECT_TRUE(server_conn->wait_readable(1000));
    EXPECT_FALSE(server_conn->recv().has_value());
}

TEST(IpcTransport, AcceptedPeerIsSameUser)
{
    auto   path = test_socket_path("cred");
    Server server;
    ASSERT_TRUE(server.listen(path));
    auto client_conn = Client::connect(path);
    ASSERT_NE(client_conn, nullptr);
    auto server_conn = accept_one(server);
    ASSERT_NE(server_conn, nullptr);

    EXPECT_EQ(server_conn->peer_uid(), std::optional<uid_t>(::geteuid()));
    EXPECT_EQ(client_conn->peer_uid(), std::optional<uid_t>(::geteuid()));
}

TEST(IpcTransport, WaitReadableTimesOut)
{
    auto   path = test_socket_path("wait");
    Server server;
    ASSERT_TRUE(server.listen(path));
    auto client_conn = Client::connect(path);
    ASSERT_NE(client_conn, nullptr);
    auto server_conn = accept_one(server);
    ASSERT_NE(server_conn, nullptr);

    EXPECT_FALSE(server_conn->wait_readable(10));
}

TEST(IpcTransport, ClosedConnection)
{
    Connection conn(-1);
    EXPECT_FALSE(conn.is_open());
    EXPECT_FALSE(conn.send(Message{}));
    EXPECT_FALSE(conn.recv().has_value());
    EXPECT_FALSE(conn.wait_readable(0));
    EXPECT_FALSE(conn.peer_uid().has_value());
}

TEST(IpcTransport, OversizedPayloadNotSent)
{
    auto   path = test_socket_path("big");
    Server server;
    ASSERT_TRUE(server.listen(path));
    auto client_conn = Client::connect(path);
    ASSERT_NE(client_conn, nullptr);

    Message msg;
    msg.payload.resize(MAX_PAYLOAD_SIZE + 1);
    EXPECT_FALSE(client_conn->send(msg));
    EXPECT_TRUE(client_conn->is_open());
}

TEST(IpcTransport, MoveTransfersOwnership)
{
    auto   path = test_socket_path("move");
    Server server;
    ASSERT_TRUE(server.listen(path));
    auto client_conn = Client::connect(path);
    ASSERT_NE(client_conn, nullptr);

    const int  fd = client_conn->fd();
    Connection moved(std::move(*client_conn));
    EXPECT_EQ(moved.fd(), fd);
    EXPECT_FALSE(client_conn->is_open());
    EXPECT_TRUE(moved.is_open());
}
