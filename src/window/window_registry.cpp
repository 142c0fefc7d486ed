#include "window_registry.hpp"

#include <casement/logger.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>

namespace casement
{

namespace
{

// Run a backend call; exceptions are logged and reported as failure.
template <typename F>
bool guarded(const char* operation, WindowRole role, F&& fn)
{
    try
    {
        fn();
        return true;
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("window", "{} on {} window failed: {}", operation, role_name(role), e.what());
        return false;
    }
}

}   // namespace

int sanitize_zoom(double level)
{
    if (std::isnan(level))
        return DEFAULT_ZOOM;

    int    best      = ZOOM_STEPS.front();
    double best_dist = std::abs(level - best);
    for (int step : ZOOM_STEPS)
    {
        double dist = std::abs(level - step);
        if (dist < best_dist)
        {
            best      = step;
            best_dist = dist;
        }
    }
    return best;
}

WindowRegistry::WindowRegistry(WindowBackend&       backend,
                               DesktopServices&     desktop,
                               ContentSource        content,
                               PlatformCapabilities caps)
    : backend_(backend), desktop_(desktop), content_(std::move(content)), caps_(caps)
{
}

WindowRegistry::~WindowRegistry()
{
    // Windows may outlive the registry inside the backend; make sure none
    // of them calls back into it.
    for (NativeWindow* win : slots_)
    {
        if (win)
            win->events() = WindowEvents{};
    }
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

NativeWindow* WindowRegistry::window(WindowRole role) const
{
    NativeWindow* win = slots_[index_of(role)];
    if (!win || win->is_destroyed())
        return nullptr;
    return win;
}

NativeWindow* WindowRegistry::open_or_focus(WindowRole role, const OpenParams& params)
{
    if (role == WindowRole::Auth)
    {
        CASEMENT_LOG_WARN("window", "Auth windows open through open_auth()");
        return window(WindowRole::Auth);
    }

    if (NativeWindow* win = window(role))
    {
        if (role == WindowRole::Settings && !params.settings_tab.empty())
        {
            std::string url = content_.url_for(role, params.settings_tab);
            guarded("load_url", role, [&] { win->load_url(url); });
        }
        if (role != WindowRole::QuickEntry || win->is_visible())
            guarded("focus", role, [&] { win->focus(); });
        return win;
    }

    std::string url = content_.url_for(role, role == WindowRole::Settings ? params.settings_tab : std::string());
    return create(role, params, url);
}

NativeWindow* WindowRegistry::open_auth(const std::string& url)
{
    if (NativeWindow* previous = window(WindowRole::Auth))
    {
        CASEMENT_LOG_INFO("window", "Replacing existing auth window");
        WindowId id = previous->id();
        guarded("destroy", WindowRole::Auth, [&] { previous->destroy(); });
        // The backend may report the close later; release the slot now so the
        // new window can take it.
        on_closed(WindowRole::Auth, id);
    }

    CASEMENT_LOG_INFO("window", "Opening auth window for {}", url);
    return create(WindowRole::Auth, {}, url);
}

NativeWindow* WindowRegistry::create(WindowRole role, const OpenParams& /*params*/, const std::string& url)
{
    const size_t idx = index_of(role);
    if (creating_[idx])
    {
        CASEMENT_LOG_DEBUG("window", "{} window is already being created", role_name(role));
        return nullptr;
    }
    creating_[idx] = true;

    WindowOptions opts = role_layout(role, caps_);
    if (role == WindowRole::Main)
        opts.always_on_top = always_on_top_;

    NativeWindow* win = nullptr;
    try
    {
        win = backend_.create_window(opts);
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("window", "Creating {} window threw: {}", role_name(role), e.what());
        win = nullptr;
    }
    creating_[idx] = false;

    if (!win)
    {
        CASEMENT_LOG_ERROR("window", "Could not create {} window", role_name(role));
        return nullptr;
    }

    slots_[idx] = win;
    wire_events(win, role);

    if (!url.empty())
        guarded("load_url", role, [&] { win->load_url(url); });
    if (role == WindowRole::Main)
        apply_zoom(win);

    CASEMENT_LOG_INFO("window", "Created {} window (id {})", role_name(role), win->id());
    return win;
}

void WindowRegistry::wire_events(NativeWindow* win, WindowRole role)
{
    const WindowId id  = win->id();
    WindowEvents&  ev  = win->events();

    ev.close_requested = [this, role]() { return on_close_requested(role); };
    ev.closed          = [this, role, id]() { on_closed(role, id); };
    ev.popup_requested = [this](const std::string& url) { return handle_popup_request(url).allow; };

    if (role == WindowRole::Auth)
    {
        // The sign-in flow hops between provider pages; only its end matters.
        ev.will_navigate = [](const std::string&) { return true; };
        // Provider popups stay beside this window; reopening Auth here would
        // end the sign-in it belongs to.
        ev.popup_requested = [this](const std::string& url)
        {
            PopupDecision decision = decide_popup(url);
            if (decision.opens_auth || decision.allow)
            {
                CASEMENT_LOG_DEBUG("navigation", "Allowing sign-in popup {}", url);
                return true;
            }
            return handle_popup_request(url).allow;
        };
        ev.did_navigate  = [this, id](const std::string& url, bool in_page)
        {
            if (in_page)
                return;
            auto parsed = parse_url(url);
            if (parsed && classify_host(parsed->host) == DomainClass::Internal)
            {
                CASEMENT_LOG_INFO("window", "Sign-in complete, closing auth window");
                NativeWindow* auth = window(WindowRole::Auth);
                if (auth && auth->id() == id)
                    guarded("close", WindowRole::Auth, [&] { auth->close(); });
            }
        };
        ev.load_failed = [](int code, const std::string& description, const std::string& url)
        { CASEMENT_LOG_WARN("window", "Auth page {} failed to load ({}: {})", url, code, description); };
        ev.certificate_error = [](const std::string& url, const std::string& error)
        {
            CASEMENT_LOG_ERROR("navigation", "Certificate error on {}: {}; denied", url, error);
            return false;
        };
        return;
    }

    ev.will_navigate = [this](const std::string& url)
    { return handle_navigation_request(url) == NavigationDecision::Allow; };
    ev.certificate_error = [](const std::string& url, const std::string& error)
    {
        CASEMENT_LOG_ERROR("navigation", "Certificate error on {}: {}; denied", url, error);
        return false;
    };

    if (role == WindowRole::QuickEntry)
        ev.blurred = [this]() { hide_quick_entry(); };
}

bool WindowRegistry::on_close_requested(WindowRole role)
{
    if (role != WindowRole::Main || quitting_)
        return true;

    CASEMENT_LOG_DEBUG("window", "Main close intercepted; hiding to tray");
    hide_to_tray();
    return false;
}

void WindowRegistry::on_closed(WindowRole role, WindowId id)
{
    const size_t idx = index_of(role);
    NativeWindow* win = slots_[idx];
    if (!win || win->id() != id)
        return;

    slots_[idx] = nullptr;
    CASEMENT_LOG_INFO("window", "{} window closed", role_name(role));

    if (role == WindowRole::Auth)
        auth_closed.emit();

    // Nothing keeps the settings window useful without Main.
    if (role == WindowRole::Main)
        close_role(WindowRole::Settings);
}

void WindowRegistry::close_role(WindowRole role)
{
    NativeWindow* win = window(role);
    if (!win)
        return;
    WindowId id = win->id();
    guarded("destroy", role, [&] { win->destroy(); });
    on_closed(role, id);
}

void WindowRegistry::close_all()
{
    for (WindowRole role : ALL_WINDOW_ROLES)
        close_role(role);

    // Popups allowed for internal hosts are not tracked in a slot.
    for (NativeWindow* win : backend_.windows())
    {
        if (win && !win->is_destroyed())
            guarded("destroy", win->role(), [&] { win->destroy(); });
    }
}

// ─── Security gate ───────────────────────────────────────────────────────────

PopupDecision WindowRegistry::handle_popup_request(const std::string& url)
{
    PopupDecision decision = decide_popup(url);

    if (decision.opens_auth)
    {
        CASEMENT_LOG_INFO("navigation", "Intercepting sign-in popup: {}", url);
        open_auth(url);
    }
    else if (decision.opens_external)
    {
        CASEMENT_LOG_INFO("navigation", "Opening {} in the default browser", url);
        bool opened = false;
        try
        {
            opened = desktop_.open_external(url);
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_ERROR("navigation", "open_external threw for {}: {}", url, e.what());
        }
        if (!opened)
            CASEMENT_LOG_WARN("navigation", "Could not hand {} to the browser", url);
    }
    else if (!decision.allow)
    {
        CASEMENT_LOG_WARN("navigation", "Dropped popup {}", url);
    }
    return decision;
}

NavigationDecision WindowRegistry::handle_navigation_request(const std::string& url)
{
    // Reloading our own pages is always allowed.
    if (content_.owns_url(url))
        return NavigationDecision::Allow;

    NavigationDecision decision = decide_navigation(url);
    if (decision == NavigationDecision::Block)
        CASEMENT_LOG_WARN("navigation", "Blocked navigation to {}", url);
    return decision;
}

// ─── Tray ────────────────────────────────────────────────────────────────────

void WindowRegistry::hide_to_tray()
{
    if (NativeWindow* main = window(WindowRole::Main))
    {
        guarded("hide", WindowRole::Main, [&] { main->hide(); });
        if (caps_.taskbar_toggle)
            guarded("set_skip_taskbar", WindowRole::Main, [&] { main->set_skip_taskbar(true); });
    }
    close_role(WindowRole::Settings);
    close_role(WindowRole::Auth);
    CASEMENT_LOG_DEBUG("window", "Hidden to tray");
}

void WindowRegistry::restore_from_tray()
{
    NativeWindow* main = window(WindowRole::Main);
    if (!main)
    {
        open_or_focus(WindowRole::Main);
        return;
    }

    if (caps_.taskbar_toggle)
        guarded("set_skip_taskbar", WindowRole::Main, [&] { main->set_skip_taskbar(false); });
    guarded("show", WindowRole::Main, [&] { main->show(); });
    guarded("focus", WindowRole::Main, [&] { main->focus(); });
    CASEMENT_LOG_DEBUG("window", "Restored from tray");
}

void WindowRegistry::set_quitting()
{
    if (quitting_)
        return;
    quitting_ = true;
    CASEMENT_LOG_INFO("window", "Quitting");
}

// ─── Main window actions ─────────────────────────────────────────────────────

bool WindowRegistry::minimize_main()
{
    NativeWindow* main = window(WindowRole::Main);
    if (!main)
        return false;
    return guarded("minimize", WindowRole::Main, [&] { main->minimize(); });
}

bool WindowRegistry::focus_main()
{
    NativeWindow* main = window(WindowRole::Main);
    if (!main)
        return false;
    return guarded("focus",
                   WindowRole::Main,
                   [&]
                   {
                       if (!main->is_visible())
                           main->show();
                       main->focus();
                   });
}

void WindowRegistry::set_always_on_top(bool enabled)
{
    always_on_top_ = enabled;
    if (NativeWindow* main = window(WindowRole::Main))
        guarded("set_always_on_top", WindowRole::Main, [&] { main->set_always_on_top(enabled); });

    CASEMENT_LOG_DEBUG("window", "Always on top {}", enabled ? "on" : "off");
    always_on_top_changed.emit(enabled);
}

void WindowRegistry::toggle_always_on_top()
{
    set_always_on_top(!always_on_top_);
}

void WindowRegistry::initialize_always_on_top(bool enabled)
{
    always_on_top_ = enabled;
    if (NativeWindow* main = window(WindowRole::Main))
        guarded("set_always_on_top", WindowRole::Main, [&] { main->set_always_on_top(enabled); });
}

// ─── Quick entry ─────────────────────────────────────────────────────────────

bool WindowRegistry::toggle_quick_entry()
{
    NativeWindow* qe = window(WindowRole::QuickEntry);
    if (qe && qe->is_visible())
    {
        hide_quick_entry();
        return false;
    }
    show_quick_entry();
    NativeWindow* shown = window(WindowRole::QuickEntry);
    return shown && shown->is_visible();
}

void WindowRegistry::show_quick_entry()
{
    NativeWindow* qe = open_or_focus(WindowRole::QuickEntry);
    if (!qe)
        return;

    DisplayArea area;
    try
    {
        area = backend_.display_near_cursor();
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_WARN("window", "Display lookup failed, using defaults: {}", e.what());
    }

    WindowOptions layout = role_layout(WindowRole::QuickEntry, caps_);
    int           x      = area.x + (area.width - static_cast<int>(layout.width)) / 2;
    int           y      = area.y + area.height / 4;

    guarded("show",
            WindowRole::QuickEntry,
            [&]
            {
                qe->set_position(x, y);
                qe->show();
                qe->focus();
            });
}

void WindowRegistry::hide_quick_entry()
{
    if (NativeWindow* qe = window(WindowRole::QuickEntry))
        guarded("hide", WindowRole::QuickEntry, [&] { qe->hide(); });
}

// ─── Zoom ────────────────────────────────────────────────────────────────────

void WindowRegistry::apply_zoom(NativeWindow* win)
{
    const double factor = zoom_level_ / 100.0;
    guarded("set_zoom_factor", win->role(), [&] { win->set_zoom_factor(factor); });
}

int WindowRegistry::set_zoom_level(int level)
{
    int sanitized = sanitize_zoom(static_cast<double>(level));
    if (sanitized == zoom_level_)
        return zoom_level_;

    zoom_level_ = sanitized;
    if (NativeWindow* main = window(WindowRole::Main))
        apply_zoom(main);

    CASEMENT_LOG_DEBUG("window", "Zoom {}%", zoom_level_);
    zoom_level_changed.emit(zoom_level_);
    return zoom_level_;
}

int WindowRegistry::zoom_in()
{
    auto it = std::upper_bound(ZOOM_STEPS.begin(), ZOOM_STEPS.end(), zoom_level_);
    if (it == ZOOM_STEPS.end())
        return zoom_level_;
    return set_zoom_level(*it);
}

int WindowRegistry::zoom_out()
{
    auto it = std::lower_bound(ZOOM_STEPS.begin(), ZOOM_STEPS.end(), zoom_level_);
    if (it == ZOOM_STEPS.begin())
        return zoom_level_;
    return set_zoom_level(*std::prev(it));
}

void WindowRegistry::initialize_zoom(int level)
{
    zoom_level_ = sanitize_zoom(static_cast<double>(level));
    if (NativeWindow* main = window(WindowRole::Main))
        apply_zoom(main);
}

}   // namespace casement
