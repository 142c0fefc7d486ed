#include "platform.hpp"

#include <casement/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>

#ifdef __linux__
    #include <spawn.h>
    #include <sys/wait.h>
    #include <unistd.h>
#endif

extern char** environ;

namespace casement
{

static std::string env_or_empty(const char* name)
{
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

static std::string to_lower(std::string s)
{
    std::transform(s.begin(),
                   s.end(),
                   s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

PlatformCapabilities detect_platform_capabilities()
{
    PlatformCapabilities caps;

#if defined(__APPLE__)
    caps.title_bar_style = TitleBarStyle::Inset;
    caps.taskbar_toggle  = false;   // the dock icon stays; no taskbar entry to hide
#else
    caps.title_bar_style = TitleBarStyle::Custom;
    caps.taskbar_toggle  = true;
#endif

    std::string session = to_lower(env_or_empty("XDG_SESSION_TYPE"));
    caps.wayland        = session == "wayland" || !env_or_empty("WAYLAND_DISPLAY").empty();

#if defined(__linux__)
    // XWayland clients can grab keys, but only while one of their own windows
    // has focus, which defeats the purpose of a global shortcut.
    caps.global_shortcuts = !caps.wayland && !env_or_empty("DISPLAY").empty();
#endif

    CASEMENT_LOG_DEBUG("platform",
                       "Capabilities: wayland={} global_shortcuts={} taskbar_toggle={}",
                       caps.wayland,
                       caps.global_shortcuts,
                       caps.taskbar_toggle);
    return caps;
}

// ─── XdgDesktop ──────────────────────────────────────────────────────────────

XdgDesktop::~XdgDesktop()
{
    reap_finished();
}

bool XdgDesktop::open_external(const std::string& url)
{
#ifdef __linux__
    pid_t       pid    = 0;
    const char* argv[] = {"xdg-open", url.c_str(), nullptr};

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    // The opener must not inherit our stdin.
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", 0, 0);

    int ret = posix_spawnp(
        &pid, "xdg-open", &actions, nullptr, const_cast<char* const*>(argv), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (ret != 0)
    {
        CASEMENT_LOG_ERROR("platform", "xdg-open failed to start (error {}) for {}", ret, url);
        return false;
    }

    children_.push_back(pid);
    CASEMENT_LOG_INFO("platform", "Opened {} in the default browser (pid {})", url, pid);
    return true;
#else
    CASEMENT_LOG_WARN("platform", "No external opener on this platform for {}", url);
    return false;
#endif
}

bool XdgDesktop::prefers_dark_theme() const
{
    // GTK_THEME=Adwaita:dark or a theme name ending in -dark.
    std::string theme = to_lower(env_or_empty("GTK_THEME"));
    if (theme.empty())
        return false;
    std::string_view view(theme);
    return view.find(":dark") != std::string_view::npos || view.ends_with("-dark");
}

std::vector<pid_t> XdgDesktop::reap_finished()
{
    std::vector<pid_t> reaped;
#ifdef __linux__
    for (auto it = children_.begin(); it != children_.end();)
    {
        int   status = 0;
        pid_t result = ::waitpid(*it, &status, WNOHANG);
        if (result == 0)
        {
            ++it;
            continue;
        }
        if (result > 0 && WIFEXITED(status) && WEXITSTATUS(status) != 0)
            CASEMENT_LOG_WARN("platform", "xdg-open pid {} exited with {}", *it, WEXITSTATUS(status));
        reaped.push_back(*it);
        it = children_.erase(it);
    }
#endif
    return reaped;
}

}   // namespace casement
