#pragma once

namespace casement::ipc::channels
{

// ─── Window controls (UI → shell) ────────────────────────────────────────────
inline constexpr const char* WINDOW_MINIMIZE     = "window.minimize";
inline constexpr const char* WINDOW_MAXIMIZE     = "window.maximize";
inline constexpr const char* WINDOW_CLOSE        = "window.close";
inline constexpr const char* WINDOW_IS_MAXIMIZED = "window.isMaximized";
inline constexpr const char* WINDOW_SHOW         = "window.show";

// ─── Theme ───────────────────────────────────────────────────────────────────
inline constexpr const char* THEME_GET     = "theme.get";
inline constexpr const char* THEME_SET     = "theme.set";
inline constexpr const char* THEME_CHANGED = "theme.changed";

// ─── Always on top ───────────────────────────────────────────────────────────
inline constexpr const char* ALWAYS_ON_TOP_GET     = "alwaysOnTop.get";
inline constexpr const char* ALWAYS_ON_TOP_SET     = "alwaysOnTop.set";
inline constexpr const char* ALWAYS_ON_TOP_CHANGED = "alwaysOnTop.changed";

// ─── Hotkeys ─────────────────────────────────────────────────────────────────
inline constexpr const char* HOTKEYS_GET                 = "hotkeys.get";
inline constexpr const char* HOTKEYS_SET                 = "hotkeys.set";
inline constexpr const char* HOTKEYS_CHANGED             = "hotkeys.changed";
inline constexpr const char* HOTKEYS_ACCELERATORS_GET    = "hotkeys.accelerators.get";
inline constexpr const char* HOTKEYS_ACCELERATOR_SET     = "hotkeys.accelerator.set";
inline constexpr const char* HOTKEYS_ACCELERATOR_CHANGED = "hotkeys.accelerator.changed";

// ─── Zoom ────────────────────────────────────────────────────────────────────
inline constexpr const char* ZOOM_GET     = "zoom.get";
inline constexpr const char* ZOOM_IN      = "zoom.in";
inline constexpr const char* ZOOM_OUT     = "zoom.out";
inline constexpr const char* ZOOM_CHANGED = "zoom.changed";

// ─── App ─────────────────────────────────────────────────────────────────────
inline constexpr const char* APP_OPEN_SETTINGS = "app.openSettings";
inline constexpr const char* APP_OPEN_SIGN_IN  = "app.openSignIn";

// ─── Quick entry ─────────────────────────────────────────────────────────────
inline constexpr const char* QUICK_ENTRY_SUBMIT = "quickEntry.submit";
inline constexpr const char* QUICK_ENTRY_HIDE   = "quickEntry.hide";
inline constexpr const char* QUICK_ENTRY_CANCEL = "quickEntry.cancel";

// ─── Shell → content ─────────────────────────────────────────────────────────
inline constexpr const char* CONTENT_NAVIGATE = "content.navigate";

// ─── Export ──────────────────────────────────────────────────────────────────
inline constexpr const char* EXPORT_PDF_SUCCEEDED = "export.pdf.succeeded";
inline constexpr const char* EXPORT_PDF_FAILED    = "export.pdf.failed";

}   // namespace casement::ipc::channels
