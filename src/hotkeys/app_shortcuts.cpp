#include "app_shortcuts.hpp"

#include <casement/logger.hpp>

#include "hotkey_registry.hpp"

namespace casement
{

AppShortcuts::AppShortcuts(HotkeyRegistry& registry) : registry_(registry)
{
    enabled_conn_ = registry_.enabled_changed.connect(
        [this](HotkeyId id, bool /*enabled*/)
        {
            if (hotkey_scope(id) == HotkeyScope::Application)
                rebuild();
        });
    accelerator_conn_ = registry_.accelerator_changed.connect(
        [this](HotkeyId id, const std::string& /*accelerator*/)
        {
            if (hotkey_scope(id) == HotkeyScope::Application)
                rebuild();
        });
    rebuild();
}

AppShortcuts::~AppShortcuts()
{
    registry_.enabled_changed.disconnect(enabled_conn_);
    registry_.accelerator_changed.disconnect(accelerator_conn_);
}

void AppShortcuts::rebuild()
{
    bindings_.clear();
    for (HotkeyId id : ALL_HOTKEYS)
    {
        if (hotkey_scope(id) != HotkeyScope::Application || !registry_.is_enabled(id))
            continue;

        auto acc = parse_accelerator(registry_.accelerator(id));
        if (!acc || acc->glfw_key == 0)
        {
            CASEMENT_LOG_WARN("hotkeys",
                              "{} ({}) cannot be bound as a window shortcut",
                              hotkey_name(id),
                              registry_.accelerator(id));
            continue;
        }

        KeyChord chord{acc->glfw_key, acc->mods};
        auto [it, inserted] = bindings_.emplace(chord, id);
        if (!inserted)
        {
            CASEMENT_LOG_WARN("hotkeys",
                              "{} shadows {} on {}",
                              hotkey_name(it->second),
                              hotkey_name(id),
                              acc->to_string());
        }
    }
}

std::optional<HotkeyId> AppShortcuts::hotkey_for(const KeyChord& chord) const
{
    auto it = bindings_.find(chord);
    if (it == bindings_.end())
        return std::nullopt;
    return it->second;
}

bool AppShortcuts::on_key(int key, int action, int mods)
{
    if (action != kGlfwPress)
        return false;

    KeyChord chord;
    chord.key  = key;
    chord.mods = static_cast<KeyMod>(mods & 0x0F);   // Mask to our modifier bits

    auto id = hotkey_for(chord);
    if (!id)
        return false;

    registry_.execute_action(*id);
    return true;
}

}   // namespace casement
