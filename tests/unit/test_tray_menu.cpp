#include <gtest/gtest.h>

#include "app/tray_menu.hpp"
#include "util/fakes.hpp"
#include "window/window_registry.hpp"

#include <stdexcept>

using namespace casement;
using namespace casement::test;

namespace
{

class TrayMenuTest : public ::testing::Test
{
   protected:
    TrayMenuTest()
        : windows(backend, desktop, ContentSource::dev_server(), caps),
          tray(windows, "Casement", [this]() { ++quits; })
    {
    }

    FakeWindowBackend    backend;
    FakeDesktop          desktop;
    PlatformCapabilities caps;
    WindowRegistry       windows;
    int                  quits = 0;
    TrayMenu             tray;
};

}   // namespace

TEST_F(TrayMenuTest, Items)
{
    EXPECT_EQ(tray.tooltip(), "Casement");
    ASSERT_EQ(tray.items().size(), 2u);
    EXPECT_EQ(tray.items()[0].id, "show");
    EXPECT_EQ(tray.items()[0].label, "Show Casement");
    EXPECT_EQ(tray.items()[1].id, "quit");
    EXPECT_EQ(tray.items()[1].label, "Quit");
}

TEST_F(TrayMenuTest, ShowRestoresHiddenMain)
{
    auto* main = static_cast<FakeNativeWindow*>(windows.open_or_focus(WindowRole::Main));
    main->close();   // hides to tray
    ASSERT_FALSE(main->visible);
    ASSERT_TRUE(main->skip_taskbar);

    EXPECT_TRUE(tray.activate("show"));
    EXPECT_TRUE(main->visible);
    EXPECT_FALSE(main->skip_taskbar);
}

TEST_F(TrayMenuTest, IconClickRecreatesMain)
{
    tray.on_icon_activated();
    EXPECT_NE(windows.window(WindowRole::Main), nullptr);
}

TEST_F(TrayMenuTest, QuitCallsBack)
{
    EXPECT_TRUE(tray.activate("quit"));
    EXPECT_EQ(quits, 1);
}

TEST_F(TrayMenuTest, UnknownItem)
{
    EXPECT_FALSE(tray.activate("reboot"));
    EXPECT_EQ(quits, 0);
    EXPECT_EQ(backend.create_calls, 0);
}

TEST_F(TrayMenuTest, ThrowingQuitIsContained)
{
    TrayMenu menu(windows, "Casement", []() { throw std::runtime_error("teardown failed"); });
    EXPECT_NO_THROW(EXPECT_TRUE(menu.activate("quit")));
}
