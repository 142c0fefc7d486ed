#pragma once

#include "global_shortcuts.hpp"

#include <string>
#include <vector>

namespace casement
{

// Global shortcuts on X11 via XGrabKey on the root window. Each accelerator
// is grabbed four times so NumLock and CapsLock do not defeat it.
//
// Owns its own Display connection; key events are read in dispatch_pending(),
// which the shell calls when connection_fd() becomes readable.
class X11GlobalShortcuts : public GlobalShortcutBackend
{
   public:
    X11GlobalShortcuts();
    ~X11GlobalShortcuts() override;

    X11GlobalShortcuts(const X11GlobalShortcuts&)            = delete;
    X11GlobalShortcuts& operator=(const X11GlobalShortcuts&) = delete;

    // False when no X display could be opened (e.g. pure Wayland session).
    bool is_available() const { return display_ != nullptr; }

    int connection_fd() const;

    bool register_shortcut(const Accelerator& accelerator, Callback callback) override;
    void unregister_shortcut(const Accelerator& accelerator) override;
    void unregister_all() override;
    bool is_registered(const Accelerator& accelerator) const override;
    void dispatch_pending() override;

   private:
    struct Grab
    {
        Accelerator  accelerator;
        unsigned int keycode   = 0;
        unsigned int modifiers = 0;
        Callback     callback;
    };

    void ungrab(const Grab& grab);

    void*             display_ = nullptr;   // Display*
    std::vector<Grab> grabs_;
};

}   // namespace casement
