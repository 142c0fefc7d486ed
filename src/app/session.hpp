#pragma once

namespace casement
{

class HotkeyRegistry;
class MessageBroker;
class RendererBridge;
class WindowRegistry;

// Start and stop order of a running shell, independent of the window
// toolkit. Shell builds the subsystems and hands them in; the session only
// sequences them.
class Session
{
   public:
    Session(WindowRegistry& windows, HotkeyRegistry& hotkeys, MessageBroker& broker, RendererBridge& bridge);

    // Apply persisted settings, register global hotkeys, then open Main.
    // Returns false if Main could not be created.
    bool start();

    // Mark quitting, release global hotkeys, close every window, stop the
    // bridge. Only the first call does anything.
    void quit();

    bool is_quitting() const { return quitting_; }

   private:
    WindowRegistry& windows_;
    HotkeyRegistry& hotkeys_;
    MessageBroker&  broker_;
    RendererBridge& bridge_;
    bool            quitting_ = false;
};

}   // namespace casement
