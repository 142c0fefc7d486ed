#include <gtest/gtest.h>

#include "app/session.hpp"
#include "hotkeys/hotkey_registry.hpp"
#include "ipc/message_broker.hpp"
#include "ipc/renderer_bridge.hpp"
#include "util/fakes.hpp"
#include "window/window_registry.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

using namespace casement;
using namespace casement::test;

namespace
{

class SessionTest : public ::testing::Test
{
   protected:
    SessionTest()
        : windows(backend, desktop, ContentSource::dev_server(), caps),
          hotkeys(os, HotkeyConfig::defaults()),
          broker(windows, hotkeys, store, desktop, backend),
          bridge(broker, windows, backend),
          session(windows, hotkeys, broker, bridge)
    {
        store.values = MessageBroker::default_settings();
        path         = (std::filesystem::temp_directory_path()
                / ("casement-session-" + std::to_string(::getpid()) + ".sock"))
                   .string();
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
    Session              session;
    std::string          path;
};

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Startup
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SessionTest, SettingsAppliedBeforeHotkeysAndMain)
{
    store.values["alwaysOnTop"] = true;
    store.values["zoomLevel"]   = int64_t{125};

    int  registrations    = 0;
    bool settings_applied = true;
    bool main_absent      = true;
    os.on_call            = [&](const std::string& call)
    {
        if (call != "register")
            return;
        ++registrations;
        settings_applied = settings_applied && windows.is_always_on_top() && windows.zoom_level() == 125;
        main_absent      = main_absent && windows.window(WindowRole::Main) == nullptr;
    };

    ASSERT_TRUE(session.start());

    EXPECT_GT(registrations, 0);
    EXPECT_TRUE(settings_applied);
    EXPECT_TRUE(main_absent);

    auto* main = backend.live(WindowRole::Main);
    ASSERT_NE(main, nullptr);
    EXPECT_TRUE(main->always_on_top);
    EXPECT_TRUE(os.holds("Ctrl+Alt+H"));
}

TEST_F(SessionTest, StartFailsWithoutMain)
{
    backend.fail_create = true;
    EXPECT_FALSE(session.start());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Quit
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SessionTest, QuitReleasesHotkeysBeforeClosingWindows)
{
    ASSERT_TRUE(bridge.listen(path));
    ASSERT_TRUE(session.start());
    auto* main = backend.live(WindowRole::Main);
    ASSERT_NE(main, nullptr);
    ASSERT_TRUE(os.holds("Ctrl+Alt+H"));

    bool quitting_first = false;
    bool main_open      = false;
    bool bridge_open    = false;
    os.on_call          = [&](const std::string& call)
    {
        if (call != "unregister_all")
            return;
        quitting_first = windows.is_quitting();
        main_open      = windows.window(WindowRole::Main) != nullptr;
        bridge_open    = bridge.is_listening();
    };

    session.quit();

    EXPECT_TRUE(quitting_first);
    EXPECT_TRUE(main_open);
    EXPECT_TRUE(bridge_open);

    EXPECT_TRUE(session.is_quitting());
    EXPECT_FALSE(os.holds("Ctrl+Alt+H"));
    EXPECT_TRUE(main->destroyed);
    EXPECT_EQ(windows.window(WindowRole::Main), nullptr);
    EXPECT_FALSE(bridge.is_listening());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(SessionTest, QuitClosesEveryWindow)
{
    ASSERT_TRUE(session.start());
    auto* main     = backend.live(WindowRole::Main);
    auto* settings = static_cast<FakeNativeWindow*>(windows.open_or_focus(WindowRole::Settings));
    auto* popup    = backend.add_untracked(WindowRole::Main);
    ASSERT_NE(settings, nullptr);

    session.quit();

    EXPECT_TRUE(main->destroyed);
    EXPECT_TRUE(settings->destroyed);
    EXPECT_TRUE(popup->destroyed);
}

TEST_F(SessionTest, QuitRunsOnce)
{
    ASSERT_TRUE(session.start());

    session.quit();
    session.quit();

    EXPECT_EQ(os.unregister_all_calls, 1);
}
