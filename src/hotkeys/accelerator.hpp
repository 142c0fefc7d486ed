#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace casement
{

// Modifier flags (same bit values as GLFW_MOD_*)
enum class KeyMod : uint8_t
{
    None    = 0,
    Shift   = 0x01,
    Control = 0x02,
    Alt     = 0x04,
    Super   = 0x08,
};

inline KeyMod operator|(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline KeyMod operator&(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline bool has_mod(KeyMod mods, KeyMod flag)
{
    return (static_cast<uint8_t>(mods) & static_cast<uint8_t>(flag)) != 0;
}

// A parsed accelerator string such as "CommandOrControl+Shift+Space".
//
// Grammar: one or more modifiers and exactly one key joined by '+',
// case-insensitive. Modifiers: Command, Cmd, Control, Ctrl,
// CommandOrControl, CmdOrCtrl, Alt, Option, AltGr, Shift, Super, Meta.
// Command/Cmd/Super/Meta map to Super; CommandOrControl maps to Control
// (this shell does not target macOS key conventions); Option/AltGr map to Alt.
struct Accelerator
{
    KeyMod      mods = KeyMod::None;
    std::string key;          // canonical key name, e.g. "Space", "F5", "num3"
    int         glfw_key = 0; // 0 when the key has no GLFW code (media keys)
    std::string x11_keysym;   // keysym name for XStringToKeysym

    bool operator==(const Accelerator& o) const { return mods == o.mods && key == o.key; }
    bool operator!=(const Accelerator& o) const { return !(*this == o); }

    // Canonical form, e.g. "Ctrl+Shift+Space". Two strings that parse to the
    // same accelerator produce the same canonical form.
    std::string to_string() const;
};

struct AcceleratorHash
{
    size_t operator()(const Accelerator& a) const
    {
        return std::hash<std::string>()(a.key) ^ (std::hash<uint8_t>()(static_cast<uint8_t>(a.mods)) << 16);
    }
};

// Returns std::nullopt for anything outside the grammar: no modifier, no key,
// two keys, an unknown token, empty segments.
std::optional<Accelerator> parse_accelerator(std::string_view text);

bool is_valid_accelerator(std::string_view text);

// Canonical key name for a GLFW key code, or empty if the key cannot be
// part of an accelerator.
std::string key_name_for_glfw(int glfw_key);

}   // namespace casement
