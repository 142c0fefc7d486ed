#include "tray_menu.hpp"

#include <casement/logger.hpp>

#include "../window/window_registry.hpp"

#include <exception>
#include <utility>

namespace casement
{

TrayMenu::TrayMenu(WindowRegistry& windows, std::string tooltip, QuitFn quit)
    : windows_(windows), tooltip_(std::move(tooltip)), quit_(std::move(quit))
{
    items_ = {{"show", "Show " + tooltip_}, {"quit", "Quit"}};
}

bool TrayMenu::activate(const std::string& id)
{
    CASEMENT_LOG_DEBUG("shell", "Tray item '{}'", id);
    if (id == "show")
    {
        windows_.restore_from_tray();
        return true;
    }
    if (id == "quit")
    {
        if (!quit_)
            return true;
        try
        {
            quit_();
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_ERROR("shell", "Quit from tray failed: {}", e.what());
        }
        return true;
    }
    CASEMENT_LOG_WARN("shell", "Unknown tray item '{}'", id);
    return false;
}

void TrayMenu::on_icon_activated()
{
    windows_.restore_from_tray();
}

}   // namespace casement
