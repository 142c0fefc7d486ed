#pragma once

#ifdef CASEMENT_USE_GLFW

    #include "native_window.hpp"
    #include "surface_link.hpp"

    #include <functional>
    #include <memory>
    #include <string>
    #include <vector>

struct GLFWwindow;

namespace casement
{

class GlfwBackend;

// One GLFW window framing a renderer-drawn surface.
class GlfwWindow : public NativeWindow
{
   public:
    GlfwWindow(GlfwBackend& backend, GLFWwindow* handle, WindowId id, const WindowOptions& options);
    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&)            = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    WindowId   id() const override { return id_; }
    WindowRole role() const override { return options_.role; }

    bool is_destroyed() const override { return destroyed_; }
    bool is_visible() const override;
    bool is_maximized() const override;
    bool is_always_on_top() const override;

    void show() override;
    void hide() override;
    void focus() override;
    void minimize() override;
    void maximize() override;
    void unmaximize() override;
    void close() override;
    void destroy() override;

    void set_always_on_top(bool on) override;
    void set_skip_taskbar(bool skip) override;
    void set_position(int x, int y) override;

    void        load_url(const std::string& url) override;
    std::string current_url() const override { return url_; }
    void        set_zoom_factor(double factor) override;

    void send(const std::string& channel, const ipc::Payload& payload) override;

    WindowEvents& events() override { return events_; }

    GLFWwindow* handle() const { return handle_; }

   private:
    friend class GlfwBackend;

    GlfwBackend&  backend_;
    GLFWwindow*   handle_ = nullptr;
    WindowId      id_;
    WindowOptions options_;
    WindowEvents  events_;
    std::string   url_;
    bool          destroyed_    = false;
    bool          skip_taskbar_ = false;
};

// WindowBackend on GLFW. Windows are created without a client API; the web
// surface is drawn by a renderer process attached through the SurfaceLink.
class GlfwBackend : public WindowBackend
{
   public:
    using KeyHandler = std::function<void(int key, int action, int mods)>;

    GlfwBackend() = default;
    ~GlfwBackend() override;

    GlfwBackend(const GlfwBackend&)            = delete;
    GlfwBackend& operator=(const GlfwBackend&) = delete;

    bool init();
    void shutdown();

    void set_surface_link(SurfaceLink* link) { link_ = link; }
    SurfaceLink* surface_link() const { return link_; }

    // Key presses of every shell window (application-scope shortcuts).
    void set_key_handler(KeyHandler handler) { key_handler_ = std::move(handler); }

    // Pump GLFW events, waiting up to `timeout` seconds for one to arrive.
    void poll_events(double timeout);

    // Free windows destroyed since the last call.
    void process_pending_closes();

    NativeWindow*              create_window(const WindowOptions& options) override;
    std::vector<NativeWindow*> windows() override;
    NativeWindow*              find_window(WindowId id) override;
    NativeWindow*              focused_window() override;
    DisplayArea                display_near_cursor() override;

   private:
    friend class GlfwWindow;

    void schedule_free(WindowId id) { pending_free_.push_back(id); }

    // Static callback trampolines (GLFW uses C callbacks)
    static void close_callback(GLFWwindow* window);
    static void focus_callback(GLFWwindow* window, int focused);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);

    bool                                     initialized_ = false;
    SurfaceLink*                             link_        = nullptr;
    KeyHandler                               key_handler_;
    std::vector<std::unique_ptr<GlfwWindow>> windows_;
    std::vector<WindowId>                    pending_free_;
    WindowId                                 next_id_ = 1;
};

}   // namespace casement

#endif   // CASEMENT_USE_GLFW
