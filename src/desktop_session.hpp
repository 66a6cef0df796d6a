#pragma once

namespace whispertrigger {

// XDG_SESSION_TYPE=wayland. Global key grabs and libxdo need X11.
bool is_wayland_session();

} // namespace whispertrigger
