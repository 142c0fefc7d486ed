#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace casement
{

enum class HotkeyId : uint8_t
{
    AlwaysOnTop = 0,
    BossKey,
    QuickEntry,
    PrintToPdf,
};

enum class HotkeyScope : uint8_t
{
    Global,        // grabbed from the OS, fires regardless of focus
    Application,   // menu accelerator, fires only while a shell window has focus
};

inline constexpr size_t HOTKEY_COUNT = 4;

inline constexpr std::array<HotkeyId, HOTKEY_COUNT> ALL_HOTKEYS = {
    HotkeyId::AlwaysOnTop,
    HotkeyId::BossKey,
    HotkeyId::QuickEntry,
    HotkeyId::PrintToPdf,
};

inline constexpr size_t index_of(HotkeyId id)
{
    return static_cast<size_t>(id);
}

// Wire/storage name: "alwaysOnTop", "bossKey", "quickEntry", "printToPdf".
const char* hotkey_name(HotkeyId id);

std::optional<HotkeyId> hotkey_from_name(std::string_view name);

HotkeyScope hotkey_scope(HotkeyId id);

const char* default_accelerator(HotkeyId id);

// Persisted keys: "hotkey.<name>.enabled" and "hotkey.<name>.accelerator".
std::string enabled_key(HotkeyId id);
std::string accelerator_key(HotkeyId id);

}   // namespace casement
