#pragma once

#include "../ipc/payload.hpp"
#include "../platform/platform.hpp"
#include "window_role.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace casement
{

using WindowId = uint64_t;

inline constexpr WindowId INVALID_WINDOW = 0;

// Creation parameters for one native window.
struct WindowOptions
{
    WindowRole         role  = WindowRole::Main;
    std::string        title = "Casement";
    uint32_t           width      = 800;
    uint32_t           height     = 600;
    uint32_t           min_width  = 0;
    uint32_t           min_height = 0;
    std::optional<int> x;
    std::optional<int> y;
    bool               frameless     = false;
    bool               transparent   = false;
    bool               always_on_top = false;
    bool               skip_taskbar  = false;
    bool               resizable     = true;
    bool               maximizable   = true;
    bool               show_on_create = true;
    TitleBarStyle      title_bar_style = TitleBarStyle::Native;
};

// Work area of a display, in screen coordinates.
struct DisplayArea
{
    int x      = 0;
    int y      = 0;
    int width  = 1920;
    int height = 1080;
};

// Callbacks a window owner installs. Every member is optional.
struct WindowEvents
{
    // Return false to cancel the close.
    std::function<bool()> close_requested;

    // The native window is gone; the handle must not be used afterwards.
    std::function<void()> closed;

    std::function<void()> blurred;

    // Return false to block navigation of the surface to `url`.
    std::function<bool(const std::string& url)> will_navigate;

    // window.open() from the surface. Return true to let it open.
    std::function<bool(const std::string& url)> popup_requested;

    std::function<void(const std::string& url, bool in_page)> did_navigate;

    std::function<void(int error_code, const std::string& description, const std::string& url)>
        load_failed;

    // Return true to proceed despite the error.
    std::function<bool(const std::string& url, const std::string& error)> certificate_error;
};

// A live native window hosting one web surface.
//
// Owned by its WindowBackend. After destroy() or the closed event the
// backend frees the object on its next poll; holders must drop their
// pointer from the closed callback.
class NativeWindow
{
   public:
    virtual ~NativeWindow() = default;

    virtual WindowId   id() const   = 0;
    virtual WindowRole role() const = 0;

    virtual bool is_destroyed() const     = 0;
    virtual bool is_visible() const       = 0;
    virtual bool is_maximized() const     = 0;
    virtual bool is_always_on_top() const = 0;

    virtual void show()       = 0;
    virtual void hide()       = 0;
    virtual void focus()      = 0;
    virtual void minimize()   = 0;
    virtual void maximize()   = 0;
    virtual void unmaximize() = 0;

    // Polite close: runs close_requested, which may cancel it.
    virtual void close() = 0;

    // Unconditional close; close_requested is not consulted.
    virtual void destroy() = 0;

    virtual void set_always_on_top(bool on) = 0;
    virtual void set_skip_taskbar(bool skip) = 0;
    virtual void set_position(int x, int y)  = 0;

    virtual void        load_url(const std::string& url) = 0;
    virtual std::string current_url() const              = 0;
    virtual void        set_zoom_factor(double factor)   = 0;

    // Deliver a broadcast to the surface. May throw if the surface is gone.
    virtual void send(const std::string& channel, const ipc::Payload& payload) = 0;

    virtual WindowEvents& events() = 0;
};

// The host window toolkit.
class WindowBackend
{
   public:
    virtual ~WindowBackend() = default;

    // Returns nullptr when the toolkit refuses to create the window.
    virtual NativeWindow* create_window(const WindowOptions& options) = 0;

    // Every window not yet freed, destroyed ones included.
    virtual std::vector<NativeWindow*> windows() = 0;

    virtual NativeWindow* find_window(WindowId id) = 0;

    virtual NativeWindow* focused_window() = 0;

    // Work area of the display under the pointer.
    virtual DisplayArea display_near_cursor() = 0;
};

}   // namespace casement
