#include <gtest/gtest.h>

#include "hotkeys/app_shortcuts.hpp"
#include "hotkeys/hotkey_registry.hpp"
#include "util/fakes.hpp"

using namespace casement;
using casement::test::FakeGlobalShortcuts;

namespace
{

constexpr int KEY_P     = 80;
constexpr int KEY_H     = 72;
constexpr int KEY_F5    = 294;
constexpr int PRESS     = 1;
constexpr int RELEASE   = 0;
constexpr int REPEAT    = 2;
constexpr int MOD_SHIFT = 0x01;
constexpr int MOD_CTRL  = 0x02;
constexpr int MOD_ALT   = 0x04;
constexpr int MOD_CAPS  = 0x10;

class AppShortcutsTest : public ::testing::Test
{
   protected:
    AppShortcutsTest() : registry(os, HotkeyConfig::defaults()), shortcuts(registry)
    {
        registry.set_action(HotkeyId::AlwaysOnTop, [this]() { ++on_top; });
        registry.set_action(HotkeyId::PrintToPdf, [this]() { ++pdf; });
        registry.set_action(HotkeyId::BossKey, [this]() { ++boss; });
    }

    FakeGlobalShortcuts os;
    HotkeyRegistry      registry;
    AppShortcuts        shortcuts;
    int                 on_top = 0;
    int                 pdf    = 0;
    int                 boss   = 0;
};

}   // namespace

TEST_F(AppShortcutsTest, BindsEnabledApplicationHotkeys)
{
    EXPECT_EQ(shortcuts.count(), 2u);

    auto id = shortcuts.hotkey_for({KEY_P, KeyMod::Control | KeyMod::Alt});
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, HotkeyId::AlwaysOnTop);

    id = shortcuts.hotkey_for({KEY_P, KeyMod::Control | KeyMod::Shift});
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, HotkeyId::PrintToPdf);
}

TEST_F(AppShortcutsTest, PressRunsAction)
{
    EXPECT_TRUE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL | MOD_ALT));
    EXPECT_EQ(on_top, 1);
    EXPECT_TRUE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL | MOD_SHIFT));
    EXPECT_EQ(pdf, 1);
}

TEST_F(AppShortcutsTest, ReleaseAndRepeatIgnored)
{
    EXPECT_FALSE(shortcuts.on_key(KEY_P, RELEASE, MOD_CTRL | MOD_ALT));
    EXPECT_FALSE(shortcuts.on_key(KEY_P, REPEAT, MOD_CTRL | MOD_ALT));
    EXPECT_EQ(on_top, 0);
}

TEST_F(AppShortcutsTest, LockModifiersMasked)
{
    EXPECT_TRUE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL | MOD_ALT | MOD_CAPS));
    EXPECT_EQ(on_top, 1);
}

TEST_F(AppShortcutsTest, ModifiersMustMatchExactly)
{
    EXPECT_FALSE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL));
    EXPECT_FALSE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL | MOD_ALT | MOD_SHIFT));
    EXPECT_EQ(on_top + pdf, 0);
}

TEST_F(AppShortcutsTest, GlobalHotkeysAreNotWindowShortcuts)
{
    EXPECT_FALSE(shortcuts.on_key(KEY_H, PRESS, MOD_CTRL | MOD_ALT));
    EXPECT_EQ(boss, 0);
}

TEST_F(AppShortcutsTest, FollowsEnabledState)
{
    registry.set_enabled(HotkeyId::AlwaysOnTop, false);
    EXPECT_EQ(shortcuts.count(), 1u);
    EXPECT_FALSE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL | MOD_ALT));

    registry.set_enabled(HotkeyId::AlwaysOnTop, true);
    EXPECT_TRUE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL | MOD_ALT));
    EXPECT_EQ(on_top, 1);
}

TEST_F(AppShortcutsTest, FollowsAcceleratorChanges)
{
    registry.set_accelerator(HotkeyId::PrintToPdf, "Ctrl+F5");

    EXPECT_FALSE(shortcuts.on_key(KEY_P, PRESS, MOD_CTRL | MOD_SHIFT));
    EXPECT_TRUE(shortcuts.on_key(KEY_F5, PRESS, MOD_CTRL));
    EXPECT_EQ(pdf, 1);
}

TEST_F(AppShortcutsTest, KeysWithoutWindowCodeAreSkipped)
{
    registry.set_accelerator(HotkeyId::PrintToPdf, "Ctrl+MediaStop");
    EXPECT_EQ(shortcuts.count(), 1u);
    EXPECT_FALSE(shortcuts.hotkey_for({0, KeyMod::Control}).has_value());
}

TEST_F(AppShortcutsTest, DisconnectsFromRegistryOnDestruction)
{
    {
        AppShortcuts transient(registry);
        EXPECT_EQ(transient.count(), 2u);
    }
    // A stale subscriber would crash here.
    registry.set_enabled(HotkeyId::AlwaysOnTop, false);
    EXPECT_EQ(shortcuts.count(), 1u);
}
