#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

namespace casement
{

enum class TitleBarStyle
{
    Native,   // OS-drawn frame and caption
    Inset,    // hidden caption, OS traffic-light buttons inset into content
    Custom,   // frameless, window controls drawn by the web surface
};

// Everything the shell does differently per platform, decided once at
// startup and injected. Tests construct whatever combination they need.
struct PlatformCapabilities
{
    TitleBarStyle title_bar_style = TitleBarStyle::Custom;

    // hide_to_tray() also removes the main window from the taskbar.
    bool taskbar_toggle = true;

    // OS-level global shortcuts can be grabbed reliably. False on Wayland,
    // where the compositor owns global key handling.
    bool global_shortcuts = true;

    // A tray/status icon is available to restore hidden windows.
    bool tray = true;

    bool wayland = false;
};

// Inspect the running session (XDG_SESSION_TYPE, WAYLAND_DISPLAY, DISPLAY).
PlatformCapabilities detect_platform_capabilities();

// Desktop services the shell hands work to.
class DesktopServices
{
   public:
    virtual ~DesktopServices() = default;

    // Open `url` in the user's default browser. Returns false if the
    // handler could not be started.
    virtual bool open_external(const std::string& url) = 0;

    // Whether the desktop asks applications for a dark appearance.
    virtual bool prefers_dark_theme() const = 0;
};

// Freedesktop implementation: xdg-open for URLs, GTK_THEME for appearance.
class XdgDesktop : public DesktopServices
{
   public:
    XdgDesktop() = default;
    ~XdgDesktop() override;

    XdgDesktop(const XdgDesktop&)            = delete;
    XdgDesktop& operator=(const XdgDesktop&) = delete;

    bool open_external(const std::string& url) override;
    bool prefers_dark_theme() const override;

    // Collect exited opener processes. Call periodically from the event loop.
    std::vector<pid_t> reap_finished();

    size_t pending_count() const { return children_.size(); }

   private:
    std::vector<pid_t> children_;
};

}   // namespace casement
