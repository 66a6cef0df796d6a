#include "hotkey_listener.hpp"

#include "desktop_session.hpp"

#include <glib.h>
#include <keybinder.h>

namespace whispertrigger {

HotkeyListener::HotkeyListener(ActionHandler handler)
    : handler_(std::move(handler)) {
    if (is_wayland_session()) {
        g_message("Wayland session, global hotkeys unavailable; "
                  "use the tray menu");
        return;
    }

    static bool initialized = false;
    if (!initialized) {
        keybinder_init();
        initialized = true;
    }
    available_ = true;
}

HotkeyListener::~HotkeyListener() {
    unbind_all();
}

void HotkeyListener::unbind_all() {
    for (const auto &binding : bindings_) {
        keybinder_unbind_all(binding->accelerator.c_str());
    }
    bindings_.clear();
}

int HotkeyListener::bind(const std::map<Action, std::string> &shortcuts) {
    unbind_all();
    if (!available_) return 0;

    int bound = 0;
    for (const auto &shortcut : shortcuts) {
        if (shortcut.second.empty()) continue;

        auto binding = std::make_unique<Binding>();
        binding->listener = this;
        binding->action = shortcut.first;
        binding->accelerator = shortcut.second;

        if (!keybinder_bind(binding->accelerator.c_str(), on_key,
                            binding.get())) {
            g_warning("Failed to bind hotkey '%s' for %s",
                      binding->accelerator.c_str(),
                      action_label(shortcut.first));
            continue;
        }
        g_debug("Bound %s to %s", binding->accelerator.c_str(),
                action_label(shortcut.first));
        bindings_.push_back(std::move(binding));
        bound++;
    }
    return bound;
}

void HotkeyListener::on_key(const char * /*keystring*/, void *user_data) {
    auto *binding = static_cast<Binding *>(user_data);
    if (binding->listener->handler_)
        binding->listener->handler_(binding->action);
}

} // namespace whispertrigger
