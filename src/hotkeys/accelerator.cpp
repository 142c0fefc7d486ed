#include "accelerator.hpp"

#include <array>
#include <cctype>
#include <vector>

namespace casement
{

// ─── Key table ───────────────────────────────────────────────────────────────

// GLFW key codes (subset needed here, to keep GLFW out of this file)
namespace glfw_keys
{
constexpr int KEY_SPACE         = 32;
constexpr int KEY_APOSTROPHE    = 39;
constexpr int KEY_COMMA         = 44;
constexpr int KEY_MINUS         = 45;
constexpr int KEY_PERIOD        = 46;
constexpr int KEY_SLASH         = 47;
constexpr int KEY_0             = 48;
constexpr int KEY_SEMICOLON     = 59;
constexpr int KEY_EQUAL         = 61;
constexpr int KEY_A             = 65;
constexpr int KEY_LEFT_BRACKET  = 91;
constexpr int KEY_BACKSLASH     = 92;
constexpr int KEY_RIGHT_BRACKET = 93;
constexpr int KEY_GRAVE_ACCENT  = 96;
constexpr int KEY_ESCAPE        = 256;
constexpr int KEY_ENTER         = 257;
constexpr int KEY_TAB           = 258;
constexpr int KEY_BACKSPACE     = 259;
constexpr int KEY_INSERT        = 260;
constexpr int KEY_DELETE        = 261;
constexpr int KEY_RIGHT         = 262;
constexpr int KEY_LEFT          = 263;
constexpr int KEY_DOWN          = 264;
constexpr int KEY_UP            = 265;
constexpr int KEY_PAGE_UP       = 266;
constexpr int KEY_PAGE_DOWN     = 267;
constexpr int KEY_HOME          = 268;
constexpr int KEY_END           = 269;
constexpr int KEY_CAPS_LOCK     = 280;
constexpr int KEY_SCROLL_LOCK   = 281;
constexpr int KEY_NUM_LOCK      = 282;
constexpr int KEY_PRINT_SCREEN  = 283;
constexpr int KEY_PAUSE         = 284;
constexpr int KEY_F1            = 290;
constexpr int KEY_KP_0          = 320;
constexpr int KEY_KP_DECIMAL    = 330;
constexpr int KEY_KP_DIVIDE     = 331;
constexpr int KEY_KP_MULTIPLY   = 332;
constexpr int KEY_KP_SUBTRACT   = 333;
constexpr int KEY_KP_ADD        = 334;
}   // namespace glfw_keys

namespace
{

struct KeyInfo
{
    std::string name;
    std::vector<std::string> aliases;
    int         glfw_key;
    std::string x11_keysym;
};

std::string to_lower(std::string_view s)
{
    std::string lower;
    lower.reserve(s.size());
    for (char c : s)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower;
}

const std::vector<KeyInfo>& key_table()
{
    using namespace glfw_keys;
    static const std::vector<KeyInfo> table = []
    {
        std::vector<KeyInfo> t;
        for (char c = 'A'; c <= 'Z'; ++c)
            t.push_back({std::string(1, c), {}, KEY_A + (c - 'A'), std::string(1, static_cast<char>(c - 'A' + 'a'))});
        for (char c = '0'; c <= '9'; ++c)
            t.push_back({std::string(1, c), {}, KEY_0 + (c - '0'), std::string(1, c)});
        for (int n = 1; n <= 24; ++n)
            t.push_back({"F" + std::to_string(n), {}, KEY_F1 + n - 1, "F" + std::to_string(n)});
        for (int n = 0; n <= 9; ++n)
            t.push_back({"num" + std::to_string(n), {}, KEY_KP_0 + n, "KP_" + std::to_string(n)});

        std::vector<KeyInfo> named = {
            {"Space", {}, KEY_SPACE, "space"},
            {"Tab", {}, KEY_TAB, "Tab"},
            {"Backspace", {}, KEY_BACKSPACE, "BackSpace"},
            {"Delete", {}, KEY_DELETE, "Delete"},
            {"Insert", {}, KEY_INSERT, "Insert"},
            {"Enter", {"Return"}, KEY_ENTER, "Return"},
            {"Escape", {"Esc"}, KEY_ESCAPE, "Escape"},
            {"Up", {}, KEY_UP, "Up"},
            {"Down", {}, KEY_DOWN, "Down"},
            {"Left", {}, KEY_LEFT, "Left"},
            {"Right", {}, KEY_RIGHT, "Right"},
            {"Home", {}, KEY_HOME, "Home"},
            {"End", {}, KEY_END, "End"},
            {"PageUp", {}, KEY_PAGE_UP, "Prior"},
            {"PageDown", {}, KEY_PAGE_DOWN, "Next"},
            // '+' separates tokens, so the plus key is only reachable by name.
            {"Plus", {}, 0, "plus"},
            {"Minus", {"-"}, KEY_MINUS, "minus"},
            {"Equal", {"="}, KEY_EQUAL, "equal"},
            {"numadd", {}, KEY_KP_ADD, "KP_Add"},
            {"numsub", {}, KEY_KP_SUBTRACT, "KP_Subtract"},
            {"nummult", {}, KEY_KP_MULTIPLY, "KP_Multiply"},
            {"numdiv", {}, KEY_KP_DIVIDE, "KP_Divide"},
            {"numdec", {}, KEY_KP_DECIMAL, "KP_Decimal"},
            {"NumLock", {"numlock"}, KEY_NUM_LOCK, "Num_Lock"},
            {"Backquote", {"`"}, KEY_GRAVE_ACCENT, "grave"},
            {"BracketLeft", {"["}, KEY_LEFT_BRACKET, "bracketleft"},
            {"BracketRight", {"]"}, KEY_RIGHT_BRACKET, "bracketright"},
            {"Backslash", {"\\"}, KEY_BACKSLASH, "backslash"},
            {"Semicolon", {";"}, KEY_SEMICOLON, "semicolon"},
            {"Quote", {"'"}, KEY_APOSTROPHE, "apostrophe"},
            {"Comma", {","}, KEY_COMMA, "comma"},
            {"Period", {"."}, KEY_PERIOD, "period"},
            {"Slash", {"/"}, KEY_SLASH, "slash"},
            {"MediaPlayPause", {}, 0, "XF86AudioPlay"},
            {"MediaStop", {}, 0, "XF86AudioStop"},
            {"MediaNextTrack", {}, 0, "XF86AudioNext"},
            {"MediaPreviousTrack", {}, 0, "XF86AudioPrev"},
            {"VolumeUp", {}, 0, "XF86AudioRaiseVolume"},
            {"VolumeDown", {}, 0, "XF86AudioLowerVolume"},
            {"VolumeMute", {}, 0, "XF86AudioMute"},
            {"PrintScreen", {}, KEY_PRINT_SCREEN, "Print"},
            {"ScrollLock", {}, KEY_SCROLL_LOCK, "Scroll_Lock"},
            {"Pause", {}, KEY_PAUSE, "Pause"},
            {"CapsLock", {}, KEY_CAPS_LOCK, "Caps_Lock"},
        };
        for (auto& k : named)
            t.push_back(std::move(k));
        return t;
    }();
    return table;
}

const KeyInfo* find_key(std::string_view token)
{
    std::string lower = to_lower(token);
    for (const auto& info : key_table())
    {
        if (to_lower(info.name) == lower)
            return &info;
        for (const auto& alias : info.aliases)
        {
            if (to_lower(alias) == lower)
                return &info;
        }
    }
    return nullptr;
}

std::optional<KeyMod> find_modifier(std::string_view token)
{
    std::string lower = to_lower(token);
    if (lower == "commandorcontrol" || lower == "cmdorctrl" || lower == "control" || lower == "ctrl")
        return KeyMod::Control;
    if (lower == "command" || lower == "cmd" || lower == "super" || lower == "meta")
        return KeyMod::Super;
    if (lower == "alt" || lower == "option" || lower == "altgr")
        return KeyMod::Alt;
    if (lower == "shift")
        return KeyMod::Shift;
    return std::nullopt;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

}   // namespace

// ─── Accelerator ─────────────────────────────────────────────────────────────

std::string Accelerator::to_string() const
{
    std::string result;
    if (has_mod(mods, KeyMod::Control))
        result += "Ctrl+";
    if (has_mod(mods, KeyMod::Alt))
        result += "Alt+";
    if (has_mod(mods, KeyMod::Shift))
        result += "Shift+";
    if (has_mod(mods, KeyMod::Super))
        result += "Super+";
    result += key;
    return result;
}

std::optional<Accelerator> parse_accelerator(std::string_view text)
{
    text = trim(text);
    if (text.empty())
        return std::nullopt;

    Accelerator    acc;
    const KeyInfo* key       = nullptr;
    bool           saw_mod   = false;
    size_t         start     = 0;

    while (start <= text.size())
    {
        size_t           plus  = text.find('+', start);
        size_t           end   = plus == std::string_view::npos ? text.size() : plus;
        std::string_view token = trim(text.substr(start, end - start));

        if (token.empty())
            return std::nullopt;

        if (auto mod = find_modifier(token))
        {
            acc.mods = acc.mods | *mod;
            saw_mod  = true;
        }
        else if (const KeyInfo* info = find_key(token))
        {
            if (key)
                return std::nullopt;   // two keys
            key = info;
        }
        else
        {
            return std::nullopt;
        }

        if (plus == std::string_view::npos)
            break;
        start = plus + 1;
    }

    if (!saw_mod || !key)
        return std::nullopt;

    acc.key        = key->name;
    acc.glfw_key   = key->glfw_key;
    acc.x11_keysym = key->x11_keysym;
    return acc;
}

bool is_valid_accelerator(std::string_view text)
{
    return parse_accelerator(text).has_value();
}

std::string key_name_for_glfw(int glfw_key)
{
    if (glfw_key == 0)
        return {};
    for (const auto& info : key_table())
    {
        if (info.glfw_key == glfw_key)
            return info.name;
    }
    return {};
}

}   // namespace casement
