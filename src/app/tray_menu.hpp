#pragma once

#include <functional>
#include <string>
#include <vector>

namespace casement
{

class WindowRegistry;

struct TrayItem
{
    std::string id;
    std::string label;
};

// Menu and activation behaviour of the status icon. The icon itself belongs
// to the desktop's status notifier host; this is what it shows and does.
class TrayMenu
{
   public:
    using QuitFn = std::function<void()>;

    TrayMenu(WindowRegistry& windows, std::string tooltip, QuitFn quit);

    const std::vector<TrayItem>& items() const { return items_; }
    const std::string&           tooltip() const { return tooltip_; }

    // Run the menu item `id`. Returns false for an unknown id.
    bool activate(const std::string& id);

    // Primary click on the icon.
    void on_icon_activated();

   private:
    WindowRegistry&       windows_;
    std::string           tooltip_;
    QuitFn                quit_;
    std::vector<TrayItem> items_;
};

}   // namespace casement
