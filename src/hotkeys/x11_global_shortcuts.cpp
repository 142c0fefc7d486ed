#include "x11_global_shortcuts.hpp"

#include <casement/logger.hpp>

#include <algorithm>

// Xlib defines None, Bool, Status and friends as macros; keep it last.
#include <X11/Xlib.h>
#include <X11/keysym.h>

namespace casement
{

namespace
{

// XGrabKey reports BadAccess asynchronously through the error handler.
bool g_grab_failed = false;

int grab_error_handler(Display* /*dpy*/, XErrorEvent* event)
{
    if (event->error_code == BadAccess)
        g_grab_failed = true;
    return 0;
}

unsigned int x11_modifiers(KeyMod mods)
{
    unsigned int mask = 0;
    if (has_mod(mods, KeyMod::Shift))
        mask |= ShiftMask;
    if (has_mod(mods, KeyMod::Control))
        mask |= ControlMask;
    if (has_mod(mods, KeyMod::Alt))
        mask |= Mod1Mask;
    if (has_mod(mods, KeyMod::Super))
        mask |= Mod4Mask;
    return mask;
}

// Lock-key variants grabbed alongside each accelerator.
constexpr unsigned int LOCK_VARIANTS[] = {0, Mod2Mask, LockMask, Mod2Mask | LockMask};

constexpr unsigned int RELEVANT_MODIFIERS = ShiftMask | ControlMask | Mod1Mask | Mod4Mask;

}   // namespace

X11GlobalShortcuts::X11GlobalShortcuts()
{
    Display* dpy = XOpenDisplay(nullptr);
    if (!dpy)
    {
        CASEMENT_LOG_WARN("hotkeys", "Cannot open X display; global shortcuts unavailable");
        return;
    }
    display_ = dpy;
    XSelectInput(dpy, DefaultRootWindow(dpy), KeyPressMask);
}

X11GlobalShortcuts::~X11GlobalShortcuts()
{
    unregister_all();
    if (display_)
    {
        XCloseDisplay(static_cast<Display*>(display_));
        display_ = nullptr;
    }
}

int X11GlobalShortcuts::connection_fd() const
{
    return display_ ? ConnectionNumber(static_cast<Display*>(display_)) : -1;
}

bool X11GlobalShortcuts::register_shortcut(const Accelerator& accelerator, Callback callback)
{
    if (!display_)
        return false;
    if (is_registered(accelerator))
    {
        CASEMENT_LOG_WARN("hotkeys", "{} is already grabbed", accelerator.to_string());
        return false;
    }

    auto*  dpy    = static_cast<Display*>(display_);
    KeySym keysym = XStringToKeysym(accelerator.x11_keysym.c_str());
    if (keysym == NoSymbol)
    {
        CASEMENT_LOG_ERROR("hotkeys", "No keysym for key {}", accelerator.key);
        return false;
    }
    unsigned int keycode = XKeysymToKeycode(dpy, keysym);
    if (keycode == 0)
    {
        CASEMENT_LOG_ERROR("hotkeys", "Key {} is not on this keyboard", accelerator.key);
        return false;
    }

    Grab grab;
    grab.accelerator = accelerator;
    grab.keycode     = keycode;
    grab.modifiers   = x11_modifiers(accelerator.mods);
    grab.callback    = std::move(callback);

    Window root     = DefaultRootWindow(dpy);
    auto   previous = XSetErrorHandler(grab_error_handler);
    g_grab_failed   = false;
    for (unsigned int lock : LOCK_VARIANTS)
        XGrabKey(dpy, static_cast<int>(keycode), grab.modifiers | lock, root, True, GrabModeAsync, GrabModeAsync);
    XSync(dpy, False);
    XSetErrorHandler(previous);

    if (g_grab_failed)
    {
        ungrab(grab);
        return false;
    }

    grabs_.push_back(std::move(grab));
    return true;
}

void X11GlobalShortcuts::ungrab(const Grab& grab)
{
    auto*  dpy  = static_cast<Display*>(display_);
    Window root = DefaultRootWindow(dpy);
    for (unsigned int lock : LOCK_VARIANTS)
        XUngrabKey(dpy, static_cast<int>(grab.keycode), grab.modifiers | lock, root);
    XSync(dpy, False);
}

void X11GlobalShortcuts::unregister_shortcut(const Accelerator& accelerator)
{
    if (!display_)
        return;
    auto it = std::find_if(grabs_.begin(),
                           grabs_.end(),
                           [&](const Grab& g) { return g.accelerator == accelerator; });
    if (it == grabs_.end())
        return;
    ungrab(*it);
    grabs_.erase(it);
}

void X11GlobalShortcuts::unregister_all()
{
    if (!display_)
        return;
    for (const auto& grab : grabs_)
        ungrab(grab);
    grabs_.clear();
}

bool X11GlobalShortcuts::is_registered(const Accelerator& accelerator) const
{
    return std::any_of(grabs_.begin(),
                       grabs_.end(),
                       [&](const Grab& g) { return g.accelerator == accelerator; });
}

void X11GlobalShortcuts::dispatch_pending()
{
    if (!display_)
        return;
    auto* dpy = static_cast<Display*>(display_);

    while (XPending(dpy) > 0)
    {
        XEvent event;
        XNextEvent(dpy, &event);
        if (event.type != KeyPress)
            continue;

        unsigned int keycode = event.xkey.keycode;
        unsigned int mods    = event.xkey.state & RELEVANT_MODIFIERS;

        // Copy the callback: it may unregister its own grab.
        Callback callback;
        for (const auto& grab : grabs_)
        {
            if (grab.keycode == keycode && grab.modifiers == mods)
            {
                callback = grab.callback;
                break;
            }
        }
        if (callback)
            callback();
    }
}

}   // namespace casement
