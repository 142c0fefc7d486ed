#pragma once

#include "../core/signal.hpp"
#include "accelerator.hpp"
#include "hotkey_ids.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace casement
{

class HotkeyRegistry;

// A key combination as delivered by a focused window: GLFW key + modifiers.
struct KeyChord
{
    int    key  = 0;
    KeyMod mods = KeyMod::None;

    bool operator==(const KeyChord& o) const { return key == o.key && mods == o.mods; }
};

struct KeyChordHash
{
    size_t operator()(const KeyChord& c) const
    {
        return std::hash<int>()(c.key) ^ (std::hash<uint8_t>()(static_cast<uint8_t>(c.mods)) << 16);
    }
};

// Dispatches Application-scope hotkeys (menu accelerators) from key events
// of focused shell windows. Bindings follow the registry: a hotkey is bound
// while enabled, to its current accelerator.
class AppShortcuts
{
   public:
    explicit AppShortcuts(HotkeyRegistry& registry);
    ~AppShortcuts();

    AppShortcuts(const AppShortcuts&)            = delete;
    AppShortcuts& operator=(const AppShortcuts&) = delete;

    // Handle a key event. Returns true if a hotkey action ran.
    // key: GLFW key code, action: GLFW_PRESS/RELEASE/REPEAT, mods: GLFW modifier bits.
    bool on_key(int key, int action, int mods);

    std::optional<HotkeyId> hotkey_for(const KeyChord& chord) const;

    size_t count() const { return bindings_.size(); }

    void rebuild();

   private:
    HotkeyRegistry&                                         registry_;
    std::unordered_map<KeyChord, HotkeyId, KeyChordHash>    bindings_;
    ConnectionId                                            enabled_conn_     = 0;
    ConnectionId                                            accelerator_conn_ = 0;

    static constexpr int kGlfwPress = 1;
};

}   // namespace casement
