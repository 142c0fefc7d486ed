#pragma once

#include "../core/signal.hpp"
#include "../platform/platform.hpp"
#include "content_source.hpp"
#include "native_window.hpp"
#include "navigation_policy.hpp"
#include "window_role.hpp"

#include <array>
#include <string>

namespace casement
{

struct OpenParams
{
    // Settings sub-view ("settings", "about"), loaded as the URL fragment.
    std::string settings_tab;
};

// Zoom steps in percent, ascending.
inline constexpr std::array<int, 11> ZOOM_STEPS = {50, 67, 75, 80, 90, 100, 110, 125, 150, 175, 200};

inline constexpr int DEFAULT_ZOOM = 100;

// Nearest zoom step; ties resolve to the lower step. NaN yields DEFAULT_ZOOM.
int sanitize_zoom(double level);

// Owns the lifecycle of every shell window: at most one live window per role,
// slots cleared when the native window closes, and the navigation/popup
// security policy for every surface it creates.
//
// All methods run on the event loop thread. Nothing here throws: backend
// exceptions are caught and logged and the call degrades to a no-op.
class WindowRegistry
{
   public:
    WindowRegistry(WindowBackend&       backend,
                   DesktopServices&     desktop,
                   ContentSource        content,
                   PlatformCapabilities caps);
    ~WindowRegistry();

    WindowRegistry(const WindowRegistry&)            = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;

    // ─── Lifecycle ───────────────────────────────────────────────────────────

    // Focus and return the live window for `role`, or create it. Returns
    // nullptr if creation failed or is already under way for that role.
    // Auth windows are opened with open_auth().
    NativeWindow* open_or_focus(WindowRole role, const OpenParams& params = {});

    // Replace any existing Auth window with a new one loading `url`.
    NativeWindow* open_auth(const std::string& url);

    // Live window for `role`, or nullptr.
    NativeWindow* window(WindowRole role) const;

    // Destroy every window without consulting close handlers.
    void close_all();

    // ─── Security gate ───────────────────────────────────────────────────────

    PopupDecision      handle_popup_request(const std::string& url);
    NavigationDecision handle_navigation_request(const std::string& url);

    // ─── Tray ────────────────────────────────────────────────────────────────

    void hide_to_tray();
    void restore_from_tray();

    // Once set, closing Main closes it instead of hiding it to the tray.
    void set_quitting();
    bool is_quitting() const { return quitting_; }

    // ─── Main window actions ─────────────────────────────────────────────────

    bool minimize_main();
    bool focus_main();

    // Applies to Main and is remembered for when Main is recreated.
    // always_on_top_changed fires on every call.
    void set_always_on_top(bool enabled);
    bool is_always_on_top() const { return always_on_top_; }
    void toggle_always_on_top();

    // Startup: apply the persisted value without announcing it.
    void initialize_always_on_top(bool enabled);

    // ─── Quick entry ─────────────────────────────────────────────────────────

    // Show if hidden or absent, hide if visible. Returns true if now visible.
    bool toggle_quick_entry();
    void show_quick_entry();
    void hide_quick_entry();

    // ─── Zoom ────────────────────────────────────────────────────────────────

    int zoom_level() const { return zoom_level_; }

    // Returns the applied (sanitised) level. zoom_level_changed fires if it moved.
    int set_zoom_level(int level);
    int zoom_in();
    int zoom_out();
    void initialize_zoom(int level);

    // ─── Events ──────────────────────────────────────────────────────────────

    Signal<bool> always_on_top_changed;
    Signal<int>  zoom_level_changed;
    Signal<>     auth_closed;

   private:
    NativeWindow* create(WindowRole role, const OpenParams& params, const std::string& url);
    void          wire_events(NativeWindow* win, WindowRole role);
    void          on_closed(WindowRole role, WindowId id);
    bool          on_close_requested(WindowRole role);
    void          close_role(WindowRole role);
    void          apply_zoom(NativeWindow* win);

    WindowBackend&       backend_;
    DesktopServices&     desktop_;
    ContentSource        content_;
    PlatformCapabilities caps_;

    std::array<NativeWindow*, WINDOW_ROLE_COUNT> slots_{};
    std::array<bool, WINDOW_ROLE_COUNT>          creating_{};

    bool quitting_      = false;
    bool always_on_top_ = false;
    int  zoom_level_    = DEFAULT_ZOOM;
};

}   // namespace casement
