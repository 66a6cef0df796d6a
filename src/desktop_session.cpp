#include "desktop_session.hpp"

#include <glib.h>

namespace whispertrigger {

bool is_wayland_session() {
    const char *type = g_getenv("XDG_SESSION_TYPE");
    return type != nullptr && g_strcmp0(type, "wayland") == 0;
}

} // namespace whispertrigger
