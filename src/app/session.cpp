#include "session.hpp"

#include <casement/logger.hpp>

#include "../hotkeys/hotkey_registry.hpp"
#include "../ipc/message_broker.hpp"
#include "../ipc/renderer_bridge.hpp"
#include "../window/window_registry.hpp"

namespace casement
{

Session::Session(WindowRegistry& windows, HotkeyRegistry& hotkeys, MessageBroker& broker, RendererBridge& bridge)
    : windows_(windows), hotkeys_(hotkeys), broker_(broker), bridge_(bridge)
{
}

bool Session::start()
{
    // Always-on-top and zoom must be in place before Main exists, and before
    // a hotkey can toggle them.
    broker_.initialize();
    hotkeys_.register_all();

    if (!windows_.open_or_focus(WindowRole::Main))
    {
        CASEMENT_LOG_CRITICAL("shell", "Could not create the main window");
        return false;
    }
    return true;
}

void Session::quit()
{
    if (quitting_)
        return;
    quitting_ = true;

    CASEMENT_LOG_INFO("shell", "Quitting");
    windows_.set_quitting();
    hotkeys_.unregister_all();
    windows_.close_all();
    bridge_.close();
}

}   // namespace casement
