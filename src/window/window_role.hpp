#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace casement
{

struct WindowOptions;
struct PlatformCapabilities;

// The fixed set of windows the shell manages. At most one live window per role.
enum class WindowRole : uint8_t
{
    Main = 0,
    Settings,
    QuickEntry,
    Auth,
};

inline constexpr size_t WINDOW_ROLE_COUNT = 4;

inline constexpr std::array<WindowRole, WINDOW_ROLE_COUNT> ALL_WINDOW_ROLES = {
    WindowRole::Main,
    WindowRole::Settings,
    WindowRole::QuickEntry,
    WindowRole::Auth,
};

inline constexpr size_t index_of(WindowRole role)
{
    return static_cast<size_t>(role);
}

// "main", "settings", "quickEntry", "auth".
const char* role_name(WindowRole role);

std::optional<WindowRole> role_from_name(std::string_view name);

// Size, chrome and stacking for a role on the given platform.
WindowOptions role_layout(WindowRole role, const PlatformCapabilities& caps);

}   // namespace casement
