#ifdef CASEMENT_USE_GLFW

    #include "glfw_backend.hpp"

    #include <casement/logger.hpp>

    #include <algorithm>
    #include <stdexcept>

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>

namespace casement
{

namespace
{

void glfw_error_callback(int code, const char* description)
{
    CASEMENT_LOG_ERROR("window", "GLFW error {}: {}", code, description ? description : "");
}

GlfwWindow* window_from(GLFWwindow* handle)
{
    return static_cast<GlfwWindow*>(glfwGetWindowUserPointer(handle));
}

}   // namespace

// ─── GlfwWindow ──────────────────────────────────────────────────────────────

GlfwWindow::GlfwWindow(GlfwBackend& backend, GLFWwindow* handle, WindowId id, const WindowOptions& options)
    : backend_(backend), handle_(handle), id_(id), options_(options), skip_taskbar_(options.skip_taskbar)
{
}

GlfwWindow::~GlfwWindow()
{
    if (handle_)
    {
        glfwSetWindowUserPointer(handle_, nullptr);
        glfwDestroyWindow(handle_);
        handle_ = nullptr;
    }
}

bool GlfwWindow::is_visible() const
{
    return !destroyed_ && glfwGetWindowAttrib(handle_, GLFW_VISIBLE) == GLFW_TRUE;
}

bool GlfwWindow::is_maximized() const
{
    return !destroyed_ && glfwGetWindowAttrib(handle_, GLFW_MAXIMIZED) == GLFW_TRUE;
}

bool GlfwWindow::is_always_on_top() const
{
    return !destroyed_ && glfwGetWindowAttrib(handle_, GLFW_FLOATING) == GLFW_TRUE;
}

void GlfwWindow::show()
{
    if (!destroyed_)
        glfwShowWindow(handle_);
}

void GlfwWindow::hide()
{
    if (!destroyed_)
        glfwHideWindow(handle_);
}

void GlfwWindow::focus()
{
    if (!destroyed_)
        glfwFocusWindow(handle_);
}

void GlfwWindow::minimize()
{
    if (!destroyed_)
        glfwIconifyWindow(handle_);
}

void GlfwWindow::maximize()
{
    if (!destroyed_ && options_.maximizable)
        glfwMaximizeWindow(handle_);
}

void GlfwWindow::unmaximize()
{
    if (!destroyed_)
        glfwRestoreWindow(handle_);
}

void GlfwWindow::close()
{
    if (destroyed_)
        return;
    if (events_.close_requested && !events_.close_requested())
    {
        glfwSetWindowShouldClose(handle_, GLFW_FALSE);
        return;
    }
    destroy();
}

void GlfwWindow::destroy()
{
    if (destroyed_)
        return;
    destroyed_ = true;

    // glfwDestroyWindow must not run inside a GLFW callback; hide now and
    // free on the next process_pending_closes().
    glfwHideWindow(handle_);
    if (backend_.link_)
        backend_.link_->detach(id_);
    backend_.schedule_free(id_);

    if (events_.closed)
    {
        auto closed = events_.closed;
        closed();
    }
}

void GlfwWindow::set_always_on_top(bool on)
{
    if (!destroyed_)
        glfwSetWindowAttrib(handle_, GLFW_FLOATING, on ? GLFW_TRUE : GLFW_FALSE);
}

void GlfwWindow::set_skip_taskbar(bool skip)
{
    // GLFW has no taskbar control; hiding the window already removes it
    // from the taskbar on X11 window managers.
    skip_taskbar_ = skip;
}

void GlfwWindow::set_position(int x, int y)
{
    if (!destroyed_)
        glfwSetWindowPos(handle_, x, y);
}

void GlfwWindow::load_url(const std::string& url)
{
    url_ = url;
    if (backend_.link_)
        backend_.link_->load_url(id_, url);
}

void GlfwWindow::set_zoom_factor(double factor)
{
    if (backend_.link_)
        backend_.link_->set_zoom(id_, factor);
}

void GlfwWindow::send(const std::string& channel, const ipc::Payload& payload)
{
    if (destroyed_)
        throw std::runtime_error("window destroyed");
    if (!backend_.link_ || !backend_.link_->deliver(id_, channel, payload))
        throw std::runtime_error("no renderer attached");
}

// ─── GlfwBackend ─────────────────────────────────────────────────────────────

GlfwBackend::~GlfwBackend()
{
    shutdown();
}

bool GlfwBackend::init()
{
    if (initialized_)
        return true;

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
    {
        CASEMENT_LOG_ERROR("window", "Failed to initialize GLFW");
        return false;
    }
    initialized_ = true;
    return true;
}

void GlfwBackend::shutdown()
{
    if (!initialized_)
        return;
    windows_.clear();
    pending_free_.clear();
    glfwTerminate();
    initialized_ = false;
}

void GlfwBackend::poll_events(double timeout)
{
    if (!initialized_)
        return;
    if (timeout > 0.0)
        glfwWaitEventsTimeout(timeout);
    else
        glfwPollEvents();
}

void GlfwBackend::process_pending_closes()
{
    if (pending_free_.empty())
        return;

    // Copy and clear to avoid re-entrancy issues
    auto ids = std::move(pending_free_);
    pending_free_.clear();

    std::erase_if(windows_,
                  [&ids](const std::unique_ptr<GlfwWindow>& w)
                  { return std::find(ids.begin(), ids.end(), w->id()) != ids.end(); });
}

NativeWindow* GlfwBackend::create_window(const WindowOptions& options)
{
    if (!initialized_)
        return nullptr;

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);   // the renderer draws the surface
    glfwWindowHint(GLFW_DECORATED, options.frameless ? GLFW_FALSE : GLFW_TRUE);
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, options.transparent ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_FLOATING, options.always_on_top ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, options.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_VISIBLE, options.show_on_create ? GLFW_TRUE : GLFW_FALSE);

    GLFWwindow* handle = glfwCreateWindow(static_cast<int>(options.width),
                                          static_cast<int>(options.height),
                                          options.title.c_str(),
                                          nullptr,
                                          nullptr);
    if (!handle)
    {
        CASEMENT_LOG_ERROR("window", "Failed to create GLFW window '{}'", options.title);
        return nullptr;
    }

    if (options.min_width > 0 || options.min_height > 0)
    {
        glfwSetWindowSizeLimits(handle,
                                options.min_width > 0 ? static_cast<int>(options.min_width) : GLFW_DONT_CARE,
                                options.min_height > 0 ? static_cast<int>(options.min_height) : GLFW_DONT_CARE,
                                GLFW_DONT_CARE,
                                GLFW_DONT_CARE);
    }
    if (options.x && options.y)
        glfwSetWindowPos(handle, *options.x, *options.y);

    auto  win = std::make_unique<GlfwWindow>(*this, handle, next_id_++, options);
    auto* raw = win.get();

    // Store this pointer for static callbacks
    glfwSetWindowUserPointer(handle, raw);
    glfwSetWindowCloseCallback(handle, close_callback);
    glfwSetWindowFocusCallback(handle, focus_callback);
    glfwSetKeyCallback(handle, key_callback);

    windows_.push_back(std::move(win));
    return raw;
}

std::vector<NativeWindow*> GlfwBackend::windows()
{
    std::vector<NativeWindow*> out;
    out.reserve(windows_.size());
    for (auto& w : windows_)
        out.push_back(w.get());
    return out;
}

NativeWindow* GlfwBackend::find_window(WindowId id)
{
    for (auto& w : windows_)
    {
        if (w->id() == id)
            return w.get();
    }
    return nullptr;
}

NativeWindow* GlfwBackend::focused_window()
{
    for (auto& w : windows_)
    {
        if (!w->is_destroyed() && glfwGetWindowAttrib(w->handle(), GLFW_FOCUSED) == GLFW_TRUE)
            return w.get();
    }
    return nullptr;
}

DisplayArea GlfwBackend::display_near_cursor()
{
    DisplayArea area;

    int           count    = 0;
    GLFWmonitor** monitors = glfwGetMonitors(&count);
    if (!monitors || count == 0)
        return area;

    // GLFW reports the cursor relative to a window; without a focused window
    // the primary monitor is used.
    GLFWmonitor* chosen = monitors[0];
    if (auto* focused = static_cast<GlfwWindow*>(focused_window()))
    {
        int    wx = 0, wy = 0;
        double cx = 0.0, cy = 0.0;
        glfwGetWindowPos(focused->handle(), &wx, &wy);
        glfwGetCursorPos(focused->handle(), &cx, &cy);
        const int px = wx + static_cast<int>(cx);
        const int py = wy + static_cast<int>(cy);

        for (int i = 0; i < count; ++i)
        {
            int mx = 0, my = 0, mw = 0, mh = 0;
            glfwGetMonitorWorkarea(monitors[i], &mx, &my, &mw, &mh);
            if (px >= mx && px < mx + mw && py >= my && py < my + mh)
            {
                chosen = monitors[i];
                break;
            }
        }
    }

    glfwGetMonitorWorkarea(chosen, &area.x, &area.y, &area.width, &area.height);
    return area;
}

// ─── Static callback trampolines ─────────────────────────────────────────────

void GlfwBackend::close_callback(GLFWwindow* window)
{
    GlfwWindow* win = window_from(window);
    if (win)
        win->close();
}

void GlfwBackend::focus_callback(GLFWwindow* window, int focused)
{
    GlfwWindow* win = window_from(window);
    if (win && !focused && !win->is_destroyed() && win->events_.blurred)
        win->events_.blurred();
}

void GlfwBackend::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    GlfwWindow* win = window_from(window);
    if (win && !win->is_destroyed() && win->backend_.key_handler_)
        win->backend_.key_handler_(key, action, mods);
}

}   // namespace casement

#endif   // CASEMENT_USE_GLFW
