#pragma once

#include "configuration.hpp"

#include <glib.h>

#include <map>
#include <string>

namespace whispertrigger {

// A key combination in canonical form. Accepts the keybinder/GTK syntax
// ("<Ctrl><Shift>space") and the "ctrl+shift+space" form of older configs.
struct Shortcut {
    enum Modifier : unsigned {
        CTRL = 1u << 0,
        SHIFT = 1u << 1,
        ALT = 1u << 2,
        SUPER = 1u << 3,
    };

    unsigned modifiers = 0;
    std::string key;

    // Accelerator string suitable for keybinder_bind().
    std::string accelerator() const;

    bool same_combination(const Shortcut &other) const;
};

bool parse_shortcut(const std::string &text, Shortcut *shortcut,
                    GError **error);

// Rewrites every non-empty binding into canonical accelerator form.
// Fails with WHISPERTRIGGER_ERROR_CONFIG on a malformed binding or when two
// actions share a combination; bindings are left untouched on failure.
bool normalize_shortcuts(std::map<Action, std::string> *bindings,
                         GError **error);

} // namespace whispertrigger
