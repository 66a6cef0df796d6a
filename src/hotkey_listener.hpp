#pragma once

#include "configuration.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace whispertrigger {

// Process-wide key grabs through keybinder. X11 only: Wayland compositors
// do not allow global grabs, so the tray menu is the fallback there.
class HotkeyListener {
public:
    using ActionHandler = std::function<void(Action action)>;

    explicit HotkeyListener(ActionHandler handler);
    ~HotkeyListener();

    HotkeyListener(const HotkeyListener &) = delete;
    HotkeyListener &operator=(const HotkeyListener &) = delete;

    bool available() const { return available_; }

    // Releases the current grabs and installs the given ones. Empty
    // accelerators are skipped. Returns the number of grabs installed.
    int bind(const std::map<Action, std::string> &shortcuts);
    void unbind_all();

private:
    struct Binding {
        HotkeyListener *listener;
        Action action;
        std::string accelerator;
    };

    static void on_key(const char *keystring, void *user_data);

    ActionHandler handler_;
    bool available_ = false;
    std::vector<std::unique_ptr<Binding>> bindings_;
};

} // namespace whispertrigger
