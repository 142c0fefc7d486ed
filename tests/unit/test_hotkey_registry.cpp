#include <gtest/gtest.h>

#include "hotkeys/hotkey_registry.hpp"
#include "util/fakes.hpp"

#include <stdexcept>
#include <vector>

using namespace casement;
using casement::test::FakeGlobalShortcuts;

namespace
{

struct EnabledEvent
{
    HotkeyId id;
    bool     enabled;
};

class HotkeyRegistryTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        registry = std::make_unique<HotkeyRegistry>(os, HotkeyConfig::defaults());
        registry->enabled_changed.connect([this](HotkeyId id, bool on) { enabled_events.push_back({id, on}); });
        registry->accelerator_changed.connect([this](HotkeyId id, const std::string& acc)
                                              { accelerator_events.emplace_back(id, acc); });
    }

    FakeGlobalShortcuts                            os;
    std::unique_ptr<HotkeyRegistry>                registry;
    std::vector<EnabledEvent>                      enabled_events;
    std::vector<std::pair<HotkeyId, std::string>>  accelerator_events;
};

}   // namespace

// ─── Registration ────────────────────────────────────────────────────────────

TEST_F(HotkeyRegistryTest, RegisterAllGrabsEnabledGlobalHotkeysOnly)
{
    registry->register_all();

    EXPECT_TRUE(registry->is_registered(HotkeyId::BossKey));
    EXPECT_TRUE(registry->is_registered(HotkeyId::QuickEntry));
    EXPECT_FALSE(registry->is_registered(HotkeyId::AlwaysOnTop));
    EXPECT_FALSE(registry->is_registered(HotkeyId::PrintToPdf));

    EXPECT_TRUE(os.holds("Ctrl+Alt+H"));
    EXPECT_TRUE(os.holds("Ctrl+Shift+Space"));
    EXPECT_FALSE(os.holds("Ctrl+Alt+P"));
    EXPECT_EQ(os.grabs.size(), 2u);

    ASSERT_TRUE(registry->registered_accelerator(HotkeyId::BossKey).has_value());
    EXPECT_EQ(*registry->registered_accelerator(HotkeyId::BossKey), "CommandOrControl+Alt+H");
}

TEST_F(HotkeyRegistryTest, RegisterAllTwiceDoesNotRegrab)
{
    registry->register_all();
    int calls = os.register_calls;
    registry->register_all();
    EXPECT_EQ(os.register_calls, calls);
}

TEST_F(HotkeyRegistryTest, DisabledGlobalHotkeyNotGrabbed)
{
    auto cfg                        = HotkeyConfig::defaults();
    cfg[HotkeyId::QuickEntry].enabled = false;
    HotkeyRegistry reg(os, cfg);
    reg.register_all();

    EXPECT_TRUE(reg.is_registered(HotkeyId::BossKey));
    EXPECT_FALSE(reg.is_registered(HotkeyId::QuickEntry));
    EXPECT_FALSE(os.holds("Ctrl+Shift+Space"));
}

TEST_F(HotkeyRegistryTest, RefusedRegistrationIsRecorded)
{
    os.refused.insert("Ctrl+Alt+H");
    registry->register_all();

    EXPECT_FALSE(registry->is_registered(HotkeyId::BossKey));
    EXPECT_TRUE(registry->registration_failed(HotkeyId::BossKey));
    EXPECT_TRUE(registry->is_enabled(HotkeyId::BossKey));

    EXPECT_TRUE(registry->is_registered(HotkeyId::QuickEntry));
    EXPECT_FALSE(registry->registration_failed(HotkeyId::QuickEntry));
}

TEST_F(HotkeyRegistryTest, SuccessfulRetryClearsFailure)
{
    os.refused.insert("Ctrl+Alt+H");
    registry->register_all();
    ASSERT_TRUE(registry->registration_failed(HotkeyId::BossKey));

    os.refused.clear();
    registry->set_accelerator(HotkeyId::BossKey, "Ctrl+Alt+J");
    registry->set_enabled(HotkeyId::BossKey, false);
    registry->set_enabled(HotkeyId::BossKey, true);

    EXPECT_TRUE(registry->is_registered(HotkeyId::BossKey));
    EXPECT_FALSE(registry->registration_failed(HotkeyId::BossKey));
    EXPECT_TRUE(os.holds("Ctrl+Alt+J"));
}

TEST_F(HotkeyRegistryTest, UnregisterAllReleasesEverything)
{
    registry->register_all();
    registry->unregister_all();

    EXPECT_EQ(os.unregister_all_calls, 1);
    EXPECT_TRUE(os.grabs.empty());
    for (HotkeyId id : ALL_HOTKEYS)
    {
        EXPECT_FALSE(registry->is_registered(id));
        EXPECT_FALSE(registry->registration_failed(id));
    }
}

TEST_F(HotkeyRegistryTest, DestructorReleasesGrabs)
{
    {
        HotkeyRegistry reg(os, HotkeyConfig::defaults());
        reg.register_all();
        EXPECT_FALSE(os.grabs.empty());
    }
    EXPECT_TRUE(os.grabs.empty());
}

// ─── set_enabled ─────────────────────────────────────────────────────────────

TEST_F(HotkeyRegistryTest, DisablingGlobalHotkeyReleasesGrab)
{
    registry->register_all();

    EXPECT_TRUE(registry->set_enabled(HotkeyId::BossKey, false));
    EXPECT_FALSE(registry->is_enabled(HotkeyId::BossKey));
    EXPECT_FALSE(registry->is_registered(HotkeyId::BossKey));
    EXPECT_FALSE(os.holds("Ctrl+Alt+H"));
    EXPECT_EQ(os.unregister_calls, 1);

    ASSERT_EQ(enabled_events.size(), 1u);
    EXPECT_EQ(enabled_events[0].id, HotkeyId::BossKey);
    EXPECT_FALSE(enabled_events[0].enabled);
}

TEST_F(HotkeyRegistryTest, EnablingGlobalHotkeyGrabs)
{
    auto cfg                     = HotkeyConfig::defaults();
    cfg[HotkeyId::BossKey].enabled = false;
    HotkeyRegistry reg(os, cfg);
    reg.register_all();
    ASSERT_FALSE(os.holds("Ctrl+Alt+H"));

    EXPECT_TRUE(reg.set_enabled(HotkeyId::BossKey, true));
    EXPECT_TRUE(reg.is_registered(HotkeyId::BossKey));
    EXPECT_TRUE(os.holds("Ctrl+Alt+H"));
}

TEST_F(HotkeyRegistryTest, SetEnabledToCurrentValueIsNoOp)
{
    registry->register_all();
    int calls = os.register_calls;

    EXPECT_FALSE(registry->set_enabled(HotkeyId::BossKey, true));
    EXPECT_FALSE(registry->set_enabled(HotkeyId::AlwaysOnTop, true));
    EXPECT_EQ(os.register_calls, calls);
    EXPECT_TRUE(enabled_events.empty());
}

TEST_F(HotkeyRegistryTest, ApplicationHotkeyNeverTouchesOs)
{
    registry->register_all();
    int reg_calls   = os.register_calls;
    int unreg_calls = os.unregister_calls;

    EXPECT_TRUE(registry->set_enabled(HotkeyId::AlwaysOnTop, false));
    EXPECT_TRUE(registry->set_enabled(HotkeyId::AlwaysOnTop, true));
    EXPECT_TRUE(registry->set_accelerator(HotkeyId::PrintToPdf, "Ctrl+Alt+E"));

    EXPECT_EQ(os.register_calls, reg_calls);
    EXPECT_EQ(os.unregister_calls, unreg_calls);
    EXPECT_EQ(enabled_events.size(), 2u);
    ASSERT_EQ(accelerator_events.size(), 1u);
    EXPECT_EQ(accelerator_events[0].first, HotkeyId::PrintToPdf);
    EXPECT_EQ(accelerator_events[0].second, "Ctrl+Alt+E");
}

TEST_F(HotkeyRegistryTest, UnsupportedSessionTracksStateOnly)
{
    auto cfg                       = HotkeyConfig::defaults();
    cfg.global_shortcuts_supported = false;
    HotkeyRegistry reg(os, cfg);
    int            events = 0;
    reg.enabled_changed.connect([&](HotkeyId, bool) { ++events; });

    reg.register_all();
    EXPECT_EQ(os.register_calls, 0);

    EXPECT_TRUE(reg.set_enabled(HotkeyId::BossKey, false));
    EXPECT_TRUE(reg.set_enabled(HotkeyId::BossKey, true));
    EXPECT_EQ(os.register_calls, 0);
    EXPECT_FALSE(reg.is_registered(HotkeyId::BossKey));
    EXPECT_TRUE(reg.is_enabled(HotkeyId::BossKey));
    EXPECT_EQ(events, 2);
}

// ─── set_accelerator ─────────────────────────────────────────────────────────

TEST_F(HotkeyRegistryTest, AcceleratorSwapWhileRegistered)
{
    registry->register_all();

    EXPECT_TRUE(registry->set_accelerator(HotkeyId::QuickEntry, "Ctrl+Alt+Space"));
    EXPECT_FALSE(os.holds("Ctrl+Shift+Space"));
    EXPECT_TRUE(os.holds("Ctrl+Alt+Space"));
    EXPECT_EQ(registry->accelerator(HotkeyId::QuickEntry), "Ctrl+Alt+Space");
    ASSERT_TRUE(registry->registered_accelerator(HotkeyId::QuickEntry).has_value());
    EXPECT_EQ(*registry->registered_accelerator(HotkeyId::QuickEntry), "Ctrl+Alt+Space");
    EXPECT_EQ(accelerator_events.size(), 1u);
}

TEST_F(HotkeyRegistryTest, AcceleratorChangeWhileDisabledTakesEffectOnEnable)
{
    registry->register_all();
    registry->set_enabled(HotkeyId::QuickEntry, false);

    EXPECT_TRUE(registry->set_accelerator(HotkeyId::QuickEntry, "Super+Q"));
    EXPECT_FALSE(os.holds("Super+Q"));
    EXPECT_FALSE(registry->is_registered(HotkeyId::QuickEntry));

    registry->set_enabled(HotkeyId::QuickEntry, true);
    EXPECT_TRUE(os.holds("Super+Q"));
    EXPECT_FALSE(os.holds("Ctrl+Shift+Space"));
}

TEST_F(HotkeyRegistryTest, InvalidAcceleratorRejected)
{
    registry->register_all();

    EXPECT_FALSE(registry->set_accelerator(HotkeyId::BossKey, "H"));
    EXPECT_FALSE(registry->set_accelerator(HotkeyId::BossKey, "Ctrl+A+B"));
    EXPECT_FALSE(registry->set_accelerator(HotkeyId::BossKey, ""));

    EXPECT_EQ(registry->accelerator(HotkeyId::BossKey), "CommandOrControl+Alt+H");
    EXPECT_TRUE(os.holds("Ctrl+Alt+H"));
    EXPECT_TRUE(accelerator_events.empty());
}

TEST_F(HotkeyRegistryTest, SameAcceleratorIsNoOp)
{
    registry->register_all();
    int calls = os.register_calls;

    EXPECT_FALSE(registry->set_accelerator(HotkeyId::BossKey, "CommandOrControl+Alt+H"));
    EXPECT_EQ(os.register_calls, calls);
    EXPECT_TRUE(accelerator_events.empty());
}

TEST_F(HotkeyRegistryTest, EmptyConfiguredAcceleratorFallsBackToDefault)
{
    auto cfg                          = HotkeyConfig::defaults();
    cfg[HotkeyId::BossKey].accelerator = "";
    HotkeyRegistry reg(os, cfg);
    EXPECT_EQ(reg.accelerator(HotkeyId::BossKey), "CommandOrControl+Alt+H");
}

// ─── Actions ─────────────────────────────────────────────────────────────────

TEST_F(HotkeyRegistryTest, OsPressRunsAction)
{
    int minimized = 0;
    registry->set_action(HotkeyId::BossKey, [&]() { ++minimized; });
    registry->register_all();

    EXPECT_TRUE(os.press("Ctrl+Alt+H"));
    EXPECT_EQ(minimized, 1);
}

TEST_F(HotkeyRegistryTest, ThrowingActionIsContained)
{
    registry->set_action(HotkeyId::QuickEntry, []() { throw std::runtime_error("boom"); });
    registry->register_all();

    EXPECT_NO_THROW(os.press("Ctrl+Shift+Space"));
    EXPECT_NO_THROW(registry->execute_action(HotkeyId::PrintToPdf));   // unbound
}
