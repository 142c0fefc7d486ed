#include "hotkey_ids.hpp"

namespace casement
{

const char* hotkey_name(HotkeyId id)
{
    switch (id)
    {
        case HotkeyId::AlwaysOnTop:
            return "alwaysOnTop";
        case HotkeyId::BossKey:
            return "bossKey";
        case HotkeyId::QuickEntry:
            return "quickEntry";
        case HotkeyId::PrintToPdf:
            return "printToPdf";
    }
    return "unknown";
}

std::optional<HotkeyId> hotkey_from_name(std::string_view name)
{
    for (HotkeyId id : ALL_HOTKEYS)
    {
        if (name == hotkey_name(id))
            return id;
    }
    return std::nullopt;
}

HotkeyScope hotkey_scope(HotkeyId id)
{
    switch (id)
    {
        case HotkeyId::BossKey:
        case HotkeyId::QuickEntry:
            return HotkeyScope::Global;
        case HotkeyId::AlwaysOnTop:
        case HotkeyId::PrintToPdf:
            return HotkeyScope::Application;
    }
    return HotkeyScope::Application;
}

const char* default_accelerator(HotkeyId id)
{
    switch (id)
    {
        case HotkeyId::AlwaysOnTop:
            return "CommandOrControl+Alt+P";
        case HotkeyId::BossKey:
            return "CommandOrControl+Alt+H";
        case HotkeyId::QuickEntry:
            return "CommandOrControl+Shift+Space";
        case HotkeyId::PrintToPdf:
            return "CommandOrControl+Shift+P";
    }
    return "";
}

std::string enabled_key(HotkeyId id)
{
    return std::string("hotkey.") + hotkey_name(id) + ".enabled";
}

std::string accelerator_key(HotkeyId id)
{
    return std::string("hotkey.") + hotkey_name(id) + ".accelerator";
}

}   // namespace casement
