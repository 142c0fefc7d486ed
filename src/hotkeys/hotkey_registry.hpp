#pragma once

#include "../core/signal.hpp"
#include "accelerator.hpp"
#include "global_shortcuts.hpp"
#include "hotkey_ids.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>

namespace casement
{

struct HotkeySetting
{
    bool        enabled = true;
    std::string accelerator;
};

// Complete hotkey configuration handed to the registry at construction.
struct HotkeyConfig
{
    std::array<HotkeySetting, HOTKEY_COUNT> settings;

    // When false (Wayland), Global-scope hotkeys are tracked but never
    // grabbed from the OS.
    bool global_shortcuts_supported = true;

    // Every hotkey enabled with its default accelerator.
    static HotkeyConfig defaults();

    HotkeySetting&       operator[](HotkeyId id) { return settings[index_of(id)]; }
    const HotkeySetting& operator[](HotkeyId id) const { return settings[index_of(id)]; }
};

// Keeps OS-level shortcut registrations consistent with the configured
// enabled/accelerator state of each hotkey.
//
// Global hotkeys move between Unregistered and Registered only through
// set_enabled(), set_accelerator(), register_all() and unregister_all().
// A Global hotkey is grabbed iff it is enabled and registered_accelerator()
// holds a value. Application hotkeys never touch the OS; their changes are
// only announced.
//
// enabled_changed and accelerator_changed fire for every effective change,
// whatever the scope.
class HotkeyRegistry
{
   public:
    using Action = std::function<void()>;

    HotkeyRegistry(GlobalShortcutBackend& backend, HotkeyConfig config);
    ~HotkeyRegistry();

    HotkeyRegistry(const HotkeyRegistry&)            = delete;
    HotkeyRegistry& operator=(const HotkeyRegistry&) = delete;

    void set_action(HotkeyId id, Action action);

    // Returns true if the enabled state changed.
    bool set_enabled(HotkeyId id, bool enabled);

    // Returns true if the accelerator changed. Strings outside the
    // accelerator grammar are rejected and logged.
    bool set_accelerator(HotkeyId id, const std::string& accelerator);

    void register_all();
    void unregister_all();

    // Run the action bound to `id`, ignoring enabled state and registration.
    // Exceptions from the action are logged.
    void execute_action(HotkeyId id);

    bool               is_enabled(HotkeyId id) const;
    const std::string& accelerator(HotkeyId id) const;
    bool               is_registered(HotkeyId id) const;
    const std::optional<std::string>& registered_accelerator(HotkeyId id) const;

    // The last OS registration attempt for `id` was refused. Cleared by the
    // next successful registration or by unregister_all().
    bool registration_failed(HotkeyId id) const;

    HotkeyConfig config() const { return config_; }

    Signal<HotkeyId, bool>        enabled_changed;
    Signal<HotkeyId, std::string> accelerator_changed;

   private:
    bool register_global(HotkeyId id);
    void unregister_global(HotkeyId id);

    GlobalShortcutBackend&                                 backend_;
    HotkeyConfig                                           config_;
    std::array<Action, HOTKEY_COUNT>                       actions_;
    std::array<std::optional<std::string>, HOTKEY_COUNT>   registered_;
    std::array<bool, HOTKEY_COUNT>                         failed_{};
};

}   // namespace casement
