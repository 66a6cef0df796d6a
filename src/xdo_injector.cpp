#include "xdo_injector.hpp"

#include "desktop_session.hpp"
#include "errors.hpp"

extern "C" {
#include <xdo.h>
}

namespace whispertrigger {

namespace {

constexpr useconds_t TYPING_DELAY_US = 12000;

constexpr auto SPAWN_FLAGS = static_cast<GSpawnFlags>(
    G_SPAWN_SEARCH_PATH | G_SPAWN_STDOUT_TO_DEV_NULL |
    G_SPAWN_STDERR_TO_DEV_NULL);

// Runs the tool with an empty string to check it works here
bool probe_tool(const char *const *argv) {
    GError *error = nullptr;
    gint exit_status = 0;
    if (g_spawn_sync(nullptr, const_cast<gchar **>(argv), nullptr,
                     SPAWN_FLAGS, nullptr, nullptr, nullptr, nullptr,
                     &exit_status, &error)) {
        return g_spawn_check_wait_status(exit_status, nullptr);
    }
    g_clear_error(&error);
    return false;
}

TypingTool detect_typing_tool() {
    if (!is_wayland_session()) return TypingTool::XDO;

    // wtype: wlroots compositors only, fails on GNOME
    const char *const wtype[] = {"wtype", "", nullptr};
    if (probe_tool(wtype)) {
        g_message("Typing will use wtype");
        return TypingTool::WTYPE;
    }

    // ydotool: any compositor, via uinput
    const char *const ydotool[] = {"ydotool", "type", "", nullptr};
    if (probe_tool(ydotool)) {
        g_message("Typing will use ydotool");
        return TypingTool::YDOTOOL;
    }

    // xdotool: X11/XWayland windows only
    const char *const xdotool[] = {"xdotool", "type", "", nullptr};
    if (probe_tool(xdotool)) {
        g_message("Typing will use xdotool");
        return TypingTool::XDOTOOL;
    }

    g_warning("No working typing tool found (need wtype, ydotool, or xdotool)");
    return TypingTool::NONE;
}

} // namespace

XdoInjector::XdoInjector() : tool_(detect_typing_tool()) {
    if (tool_ == TypingTool::XDO) {
        xdo_ = xdo_new(nullptr);
        if (xdo_ == nullptr) {
            g_warning("Failed to create xdo handle");
            tool_ = TypingTool::NONE;
        }
    }
}

XdoInjector::~XdoInjector() {
    if (xdo_ != nullptr) {
        xdo_free(xdo_);
        xdo_ = nullptr;
    }
}

void XdoInjector::remember_focus() {
    focused_window_ = 0;
    if (xdo_ == nullptr) return;

    Window window = 0;
    if (xdo_get_focused_window_sane(xdo_, &window) == XDO_SUCCESS) {
        focused_window_ = window;
    } else {
        g_debug("Could not determine the focused window");
    }
}

std::string XdoInjector::focus_title() const {
    if (xdo_ == nullptr || focused_window_ == 0) return "";

    unsigned char *name = nullptr;
    int name_len = 0;
    int name_type = 0;
    if (xdo_get_window_name(xdo_, focused_window_, &name, &name_len,
                            &name_type) != XDO_SUCCESS ||
        name == nullptr) {
        return "";
    }
    std::string title(reinterpret_cast<const char *>(name),
                      static_cast<size_t>(name_len));
    XFree(name);
    return title;
}

bool XdoInjector::spawn_tool(const char *const *argv, GError **error) {
    gint exit_status = 0;
    GError *spawn_error = nullptr;
    if (!g_spawn_sync(nullptr, const_cast<gchar **>(argv), nullptr,
                      SPAWN_FLAGS, nullptr, nullptr, nullptr, nullptr,
                      &exit_status, &spawn_error) ||
        !g_spawn_check_wait_status(exit_status, &spawn_error)) {
        g_set_error(error, WHISPERTRIGGER_ERROR,
                    WHISPERTRIGGER_ERROR_INJECTION, "%s failed: %s", argv[0],
                    spawn_error->message);
        g_error_free(spawn_error);
        return false;
    }
    return true;
}

bool XdoInjector::type_text(const std::string &text, GError **error) {
    switch (tool_) {
    case TypingTool::XDO: {
        if (focused_window_ != 0) {
            if (xdo_activate_window(xdo_, focused_window_) == XDO_SUCCESS) {
                xdo_wait_for_window_active(xdo_, focused_window_, 1);
            } else {
                g_debug("Could not re-activate window 0x%lx",
                        focused_window_);
            }
        }
        if (xdo_enter_text_window(xdo_, CURRENTWINDOW, text.c_str(),
                                  TYPING_DELAY_US) != XDO_SUCCESS) {
            g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_INJECTION,
                                "xdo could not type into the window");
            return false;
        }
        return true;
    }
    case TypingTool::WTYPE: {
        const char *const argv[] = {"wtype", "--", text.c_str(), nullptr};
        return spawn_tool(argv, error);
    }
    case TypingTool::YDOTOOL: {
        const char *const argv[] = {"ydotool", "type", "--", text.c_str(),
                                    nullptr};
        return spawn_tool(argv, error);
    }
    case TypingTool::XDOTOOL: {
        const char *const argv[] = {"xdotool", "type", "--clearmodifiers",
                                    "--", text.c_str(), nullptr};
        return spawn_tool(argv, error);
    }
    case TypingTool::NONE:
        break;
    }

    g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_INJECTION,
                        "No typing tool available");
    return false;
}

} // namespace whispertrigger
