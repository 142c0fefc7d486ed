#include "window_role.hpp"

#include "native_window.hpp"

namespace casement
{

const char* role_name(WindowRole role)
{
    switch (role)
    {
        case WindowRole::Main:
            return "main";
        case WindowRole::Settings:
            return "settings";
        case WindowRole::QuickEntry:
            return "quickEntry";
        case WindowRole::Auth:
            return "auth";
    }
    return "main";
}

std::optional<WindowRole> role_from_name(std::string_view name)
{
    for (WindowRole role : ALL_WINDOW_ROLES)
    {
        if (name == role_name(role))
            return role;
    }
    return std::nullopt;
}

WindowOptions role_layout(WindowRole role, const PlatformCapabilities& caps)
{
    WindowOptions opts;
    opts.role            = role;
    opts.title_bar_style = caps.title_bar_style;

    switch (role)
    {
        case WindowRole::Main:
            opts.title      = "Casement";
            opts.width      = 1200;
            opts.height     = 800;
            opts.min_width  = 200;
            opts.min_height = 600;
            opts.frameless  = true;
            break;

        case WindowRole::Settings:
            opts.title       = "Settings";
            opts.width       = 600;
            opts.height      = 400;
            opts.frameless   = true;
            opts.maximizable = false;
            break;

        case WindowRole::QuickEntry:
            opts.title          = "Quick Entry";
            opts.width          = 600;
            opts.height         = 80;
            opts.frameless      = true;
            opts.transparent    = true;
            opts.always_on_top  = true;
            opts.skip_taskbar   = true;
            opts.resizable      = false;
            opts.maximizable    = false;
            opts.show_on_create = false;   // positioned first, then shown
            break;

        case WindowRole::Auth:
            // Plain titled window so the provider's page is recognisable.
            opts.title           = "Sign in";
            opts.width           = 500;
            opts.height          = 700;
            opts.title_bar_style = TitleBarStyle::Native;
            break;
    }
    return opts;
}

}   // namespace casement
