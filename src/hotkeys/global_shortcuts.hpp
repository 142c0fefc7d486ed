#pragma once

#include "accelerator.hpp"

#include <functional>

namespace casement
{

// OS-level shortcut grabbing. One registration per accelerator; a second
// register of the same accelerator fails.
class GlobalShortcutBackend
{
   public:
    using Callback = std::function<void()>;

    virtual ~GlobalShortcutBackend() = default;

    // Single synchronous attempt. Returns false when the OS refuses (for
    // example another client already holds the combination).
    virtual bool register_shortcut(const Accelerator& accelerator, Callback callback) = 0;

    virtual void unregister_shortcut(const Accelerator& accelerator) = 0;

    virtual void unregister_all() = 0;

    virtual bool is_registered(const Accelerator& accelerator) const = 0;

    // Deliver pending key events to callbacks. Called from the event loop.
    virtual void dispatch_pending() {}
};

// For sessions without OS-level shortcuts (Wayland, no X display). Every
// registration is refused.
class UnsupportedGlobalShortcuts : public GlobalShortcutBackend
{
   public:
    bool register_shortcut(const Accelerator&, Callback) override { return false; }
    void unregister_shortcut(const Accelerator&) override {}
    void unregister_all() override {}
    bool is_registered(const Accelerator&) const override { return false; }
};

}   // namespace casement
