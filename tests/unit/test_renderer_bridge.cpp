#include <gtest/gtest.h>

#include "ipc/channels.hpp"
#include "ipc/codec.hpp"
#include "ipc/message_broker.hpp"
#include "ipc/renderer_bridge.hpp"
#include "util/fakes.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>

using namespace casement;
using namespace casement::test;
namespace ch = casement::ipc::channels;

namespace
{

// Shell and renderer in one thread: the renderer side writes, then pump()
// lets the bridge accept and handle what arrived.
class RendererBridgeTest : public ::testing::Test
{
   protected:
    RendererBridgeTest()
        : windows(backend, desktop, ContentSource::dev_server(), caps),
          hotkeys(os, HotkeyConfig::defaults()),
          broker(windows, hotkeys, store, desktop, backend),
          bridge(broker, windows, backend)
    {
        store.values = MessageBroker::default_settings();
        path = (std::filesystem::temp_directory_path()
                / ("casement-bridge-" + std::to_string(::getpid()) + ".sock"))
                   .string();
    }

    void SetUp() override { ASSERT_TRUE(bridge.listen(path)); }

    void pump(int rounds = 4)
    {
        for (int i = 0; i < rounds; ++i)
            bridge.poll(20);
    }

    std::unique_ptr<ipc::Connection> connect()
    {
        auto conn = ipc::Client::connect(path);
        EXPECT_NE(conn, nullptr);
        return conn;
    }

    void send(ipc::Connection&     conn,
              ipc::MessageType     type,
              std::vector<uint8_t> payload,
              ipc::RequestId       request_id = ipc::INVALID_REQUEST)
    {
        ipc::Message msg;
        msg.header.type       = type;
        msg.header.request_id = request_id;
        msg.payload           = std::move(payload);
        ASSERT_TRUE(conn.send(msg));
    }

    void hello(ipc::Connection& conn, const std::string& role, uint16_t major = ipc::PROTOCOL_MAJOR)
    {
        send(conn, ipc::MessageType::HELLO, ipc::encode_hello({major, 0, role, "test-renderer"}), 1);
    }

    void request(ipc::Connection&    conn,
                 ipc::MessageType    type,
                 const std::string&  channel,
                 ipc::Payload        args       = {},
                 ipc::RequestId      request_id = ipc::INVALID_REQUEST)
    {
        send(conn, type, ipc::encode_channel({channel, std::move(args)}), request_id);
    }

    // What the shell sent to `conn`, or nullopt if nothing arrived.
    std::optional<ipc::Message> next(ipc::Connection& conn)
    {
        if (!conn.wait_readable(1000))
            return std::nullopt;
        return conn.recv();
    }

    // Renderer attached to the live window of `role`, WELCOME consumed.
    std::unique_ptr<ipc::Connection> attach(const std::string& role)
    {
        auto conn = connect();
        if (!conn)
            return nullptr;
        hello(*conn, role);
        pump();
        auto welcome = next(*conn);
        EXPECT_TRUE(welcome.has_value());
        if (welcome)
        {
            EXPECT_EQ(welcome->header.type, ipc::MessageType::WELCOME);
        }
        return conn;
    }

    std::optional<ipc::RespErrPayload> expect_error(ipc::Connection& conn)
    {
        auto msg = next(conn);
        if (!msg || msg->header.type != ipc::MessageType::RESP_ERR)
            return std::nullopt;
        return ipc::decode_resp_err(msg->payload);
    }

    std::optional<ipc::RespOkPayload> expect_ok(ipc::Connection& conn)
    {
        auto msg = next(conn);
        if (!msg || msg->header.type != ipc::MessageType::RESP_OK)
            return std::nullopt;
        return ipc::decode_resp_ok(msg->payload);
    }

    FakeNativeWindow* open(WindowRole role)
    {
        return static_cast<FakeNativeWindow*>(windows.open_or_focus(role));
    }

    FakeWindowBackend    backend;
    FakeDesktop          desktop;
    FakeGlobalShortcuts  os;
    MemorySettingsStore  store;
    PlatformCapabilities caps;
    WindowRegistry       windows;
    HotkeyRegistry       hotkeys;
    MessageBroker        broker;
    RendererBridge       bridge;
    std::string          path;
};

uint32_t code(ipc::ErrorCode c)
{
    return static_cast<uint32_t>(c);
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RendererBridgeTest, HelloAttachesToLiveWindow)
{
    auto* main = open(WindowRole::Main);
    ASSERT_NE(main, nullptr);

    auto conn = connect();
    ASSERT_NE(conn, nullptr);
    hello(*conn, "main");
    pump();

    auto msg = next(*conn);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->header.type, ipc::MessageType::WELCOME);
    EXPECT_EQ(msg->header.request_id, 1u);
    EXPECT_EQ(msg->header.window_id, main->id());

    auto welcome = ipc::decode_welcome(msg->payload);
    ASSERT_TRUE(welcome.has_value());
    EXPECT_EQ(welcome->window_id, main->id());
    EXPECT_NE(welcome->session_id, ipc::INVALID_SESSION);
    EXPECT_EQ(welcome->url, main->current_url());
    EXPECT_DOUBLE_EQ(welcome->zoom_factor, 1.0);

    EXPECT_TRUE(bridge.is_attached(main->id()));
    EXPECT_EQ(bridge.client_count(), 1u);
}

TEST_F(RendererBridgeTest, PageAndZoomReplayedOnAttach)
{
    auto* main = open(WindowRole::Main);
    bridge.load_url(main->id(), "https://gemini.google.com/app");
    bridge.set_zoom(main->id(), 1.25);

    auto conn = connect();
    hello(*conn, "main");
    pump();

    auto msg = next(*conn);
    ASSERT_TRUE(msg.has_value());
    auto welcome = ipc::decode_welcome(msg->payload);
    ASSERT_TRUE(welcome.has_value());
    EXPECT_EQ(welcome->url, "https://gemini.google.com/app");
    EXPECT_DOUBLE_EQ(welcome->zoom_factor, 1.25);
}

TEST_F(RendererBridgeTest, UnknownRoleRefused)
{
    auto conn = connect();
    hello(*conn, "sidebar");
    pump();

    auto err = expect_error(*conn);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, code(ipc::ErrorCode::UNKNOWN_ROLE));
    EXPECT_FALSE(next(*conn).has_value());
    EXPECT_EQ(bridge.client_count(), 0u);
}

TEST_F(RendererBridgeTest, RoleWithoutWindowRefused)
{
    open(WindowRole::Main);
    auto conn = connect();
    hello(*conn, "settings");
    pump();

    auto err = expect_error(*conn);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, code(ipc::ErrorCode::NOT_ATTACHED));
}

TEST_F(RendererBridgeTest, ProtocolMismatchRefused)
{
    open(WindowRole::Main);
    auto conn = connect();
    hello(*conn, "main", ipc::PROTOCOL_MAJOR + 1);
    pump();

    auto err = expect_error(*conn);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, code(ipc::ErrorCode::PROTOCOL_MISMATCH));
    EXPECT_FALSE(next(*conn).has_value());
}

TEST_F(RendererBridgeTest, NewerRendererReplacesOld)
{
    auto* main  = open(WindowRole::Main);
    auto  first = attach("main");
    ASSERT_NE(first, nullptr);
    auto second = attach("main");
    ASSERT_NE(second, nullptr);

    EXPECT_FALSE(next(*first).has_value());   // closed by the shell
    pump();
    EXPECT_EQ(bridge.client_count(), 1u);
    EXPECT_TRUE(bridge.is_attached(main->id()));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RendererBridgeTest, InvokeRepliesWithResult)
{
    open(WindowRole::Main);
    auto conn = attach("main");

    request(*conn, ipc::MessageType::REQ_INVOKE, ch::ZOOM_GET, {}, 9);
    pump();

    auto ok = expect_ok(*conn);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->request_id, 9u);
    EXPECT_EQ(ipc::get_int(ok->result, "level"), 100);
}

TEST_F(RendererBridgeTest, InvokeWithoutResultGetsEmptyOk)
{
    auto* main = open(WindowRole::Main);
    auto  conn = attach("main");

    request(*conn, ipc::MessageType::REQ_INVOKE, ch::WINDOW_MINIMIZE, {}, 12);
    pump();

    auto ok = expect_ok(*conn);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->request_id, 12u);
    EXPECT_TRUE(ok->result.empty());
    EXPECT_EQ(main->minimize_count, 1);
}

TEST_F(RendererBridgeTest, SendActsOnSenderWindow)
{
    auto* main = open(WindowRole::Main);
    auto  conn = attach("main");

    request(*conn, ipc::MessageType::REQ_SEND, ch::WINDOW_MAXIMIZE);
    pump();

    EXPECT_TRUE(main->maximized);
}

TEST_F(RendererBridgeTest, UnknownChannelRejected)
{
    open(WindowRole::Main);
    auto conn = attach("main");

    request(*conn, ipc::MessageType::REQ_INVOKE, "fs.readFile", {{"path", std::string("/etc/passwd")}}, 3);
    pump();

    auto err = expect_error(*conn);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->request_id, 3u);
    EXPECT_EQ(err->code, code(ipc::ErrorCode::UNKNOWN_CHANNEL));
}

TEST_F(RendererBridgeTest, MalformedRequestRejected)
{
    open(WindowRole::Main);
    auto conn = attach("main");

    send(*conn, ipc::MessageType::REQ_INVOKE, {0x40, 0x01}, 4);
    pump();

    auto err = expect_error(*conn);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, code(ipc::ErrorCode::MALFORMED));
    EXPECT_TRUE(bridge.is_attached(windows.window(WindowRole::Main)->id()));
}

TEST_F(RendererBridgeTest, UnattachedConnectionMayOnlyShow)
{
    auto* main = open(WindowRole::Main);
    main->hide();

    auto conn = connect();
    request(*conn, ipc::MessageType::REQ_INVOKE, ch::THEME_GET, {}, 5);
    pump();

    auto err = expect_error(*conn);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, code(ipc::ErrorCode::NOT_ATTACHED));

    request(*conn, ipc::MessageType::REQ_SEND, ch::WINDOW_SHOW);
    pump();
    EXPECT_TRUE(main->is_visible());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Shell to renderer
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RendererBridgeTest, DeliverSendsBroadcast)
{
    auto* main = open(WindowRole::Main);
    auto  conn = attach("main");

    EXPECT_TRUE(bridge.deliver(main->id(), ch::THEME_CHANGED, {{"theme", std::string("dark")}}));

    auto msg = next(*conn);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->header.type, ipc::MessageType::EVT_BROADCAST);
    auto cp = ipc::decode_channel(msg->payload);
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->channel, ch::THEME_CHANGED);
    EXPECT_EQ(ipc::get_string(cp->args, "theme"), "dark");
}

TEST_F(RendererBridgeTest, DeliverWithoutRenderer)
{
    auto* main = open(WindowRole::Main);
    EXPECT_FALSE(bridge.deliver(main->id(), ch::THEME_CHANGED, {}));
    EXPECT_FALSE(bridge.deliver(INVALID_WINDOW, ch::THEME_CHANGED, {}));
}

TEST_F(RendererBridgeTest, LoadUrlAndZoomCommands)
{
    auto* main = open(WindowRole::Main);
    auto  conn = attach("main");

    bridge.load_url(main->id(), "http://localhost:1420/index.html");
    bridge.set_zoom(main->id(), 0.9);

    auto load = next(*conn);
    ASSERT_TRUE(load.has_value());
    EXPECT_EQ(load->header.type, ipc::MessageType::CMD_LOAD_URL);
    EXPECT_EQ(ipc::decode_cmd_load_url(load->payload)->url, "http://localhost:1420/index.html");

    auto zoom = next(*conn);
    ASSERT_TRUE(zoom.has_value());
    EXPECT_EQ(zoom->header.type, ipc::MessageType::CMD_SET_ZOOM);
    EXPECT_DOUBLE_EQ(ipc::decode_cmd_set_zoom(zoom->payload)->factor, 0.9);
}

TEST_F(RendererBridgeTest, DetachClosesRenderer)
{
    auto* main = open(WindowRole::Main);
    auto  conn = attach("main");

    bridge.detach(main->id());
    EXPECT_FALSE(bridge.is_attached(main->id()));
    EXPECT_FALSE(next(*conn).has_value());

    pump(1);
    EXPECT_EQ(bridge.client_count(), 0u);
}

TEST_F(RendererBridgeTest, RendererDisconnectIsSwept)
{
    auto* main = open(WindowRole::Main);
    auto  conn = attach("main");
    conn->close();

    pump();
    EXPECT_EQ(bridge.client_count(), 0u);
    EXPECT_FALSE(bridge.is_attached(main->id()));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Surface reports
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RendererBridgeTest, NavigationGate)
{
    open(WindowRole::Main);
    auto conn = attach("main");

    ipc::EvtNavigationPayload nav;
    nav.url = "https://example.com/";
    send(*conn, ipc::MessageType::EVT_WILL_NAVIGATE, ipc::encode_evt_navigation(nav), 20);
    pump();
    auto blocked = expect_ok(*conn);
    ASSERT_TRUE(blocked.has_value());
    EXPECT_EQ(blocked->request_id, 20u);
    EXPECT_EQ(ipc::get_bool(blocked->result, "allow"), false);

    nav.url = "https://gemini.google.com/app";
    send(*conn, ipc::MessageType::EVT_WILL_NAVIGATE, ipc::encode_evt_navigation(nav), 21);
    pump();
    auto allowed = expect_ok(*conn);
    ASSERT_TRUE(allowed.has_value());
    EXPECT_EQ(ipc::get_bool(allowed->result, "allow"), true);
}

TEST_F(RendererBridgeTest, SignInPopupOpensAuthWindow)
{
    open(WindowRole::Main);
    auto conn = attach("main");

    ipc::EvtNavigationPayload nav;
    nav.url = "https://accounts.google.com/o/oauth2/auth";
    send(*conn, ipc::MessageType::EVT_POPUP, ipc::encode_evt_navigation(nav), 30);
    pump();

    auto ok = expect_ok(*conn);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ipc::get_bool(ok->result, "allow"), false);
    ASSERT_NE(backend.live(WindowRole::Auth), nullptr);
    EXPECT_EQ(backend.live(WindowRole::Auth)->url, nav.url);
}

TEST_F(RendererBridgeTest, CertificateErrorDenied)
{
    open(WindowRole::Main);
    auto conn = attach("main");

    ipc::EvtNavigationPayload nav;
    nav.url         = "https://gemini.google.com/";
    nav.description = "net::ERR_CERT_AUTHORITY_INVALID";
    send(*conn, ipc::MessageType::EVT_CERT_ERROR, ipc::encode_evt_navigation(nav), 31);
    pump();

    auto ok = expect_ok(*conn);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ipc::get_bool(ok->result, "allow"), false);
}

TEST_F(RendererBridgeTest, DidNavigateRememberedForNextRenderer)
{
    open(WindowRole::Main);
    auto first = attach("main");

    ipc::EvtNavigationPayload nav;
    nav.url = "https://gemini.google.com/app/abc";
    send(*first, ipc::MessageType::EVT_DID_NAVIGATE, ipc::encode_evt_navigation(nav));
    nav.url     = "https://gemini.google.com/app/abc#section";
    nav.in_page = true;
    send(*first, ipc::MessageType::EVT_DID_NAVIGATE, ipc::encode_evt_navigation(nav));
    pump();

    auto second = connect();
    hello(*second, "main");
    pump();
    auto msg = next(*second);
    ASSERT_TRUE(msg.has_value());
    auto welcome = ipc::decode_welcome(msg->payload);
    ASSERT_TRUE(welcome.has_value());
    EXPECT_EQ(welcome->url, "https://gemini.google.com/app/abc");
}

TEST_F(RendererBridgeTest, KeyReportReachesHandler)
{
    open(WindowRole::Main);
    auto conn = attach("main");

    int seen_key = 0, seen_action = -1, seen_mods = -1;
    bridge.set_key_handler(
        [&](int key, int action, int mods)
        {
            seen_key    = key;
            seen_action = action;
            seen_mods   = mods;
        });

    send(*conn, ipc::MessageType::EVT_KEY, ipc::encode_evt_key({80, 1, 0x3}));
    pump();

    EXPECT_EQ(seen_key, 80);
    EXPECT_EQ(seen_action, 1);
    EXPECT_EQ(seen_mods, 0x3);
}

TEST_F(RendererBridgeTest, BlurReachesQuickEntry)
{
    open(WindowRole::Main);
    auto* quick = open(WindowRole::QuickEntry);
    ASSERT_NE(quick, nullptr);
    quick->show();
    auto conn = attach("quickEntry");

    send(*conn, ipc::MessageType::EVT_BLUR, {});
    pump();

    EXPECT_FALSE(quick->is_visible());
}
