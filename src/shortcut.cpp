#include "shortcut.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace whispertrigger {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::string trim(const std::string &text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool modifier_from_name(const std::string &name, unsigned *modifier) {
    const std::string lower = to_lower(name);
    if (lower == "ctrl" || lower == "control" || lower == "primary") {
        *modifier = Shortcut::CTRL;
    } else if (lower == "shift") {
        *modifier = Shortcut::SHIFT;
    } else if (lower == "alt" || lower == "mod1") {
        *modifier = Shortcut::ALT;
    } else if (lower == "super" || lower == "cmd" || lower == "win" ||
               lower == "meta" || lower == "mod4") {
        *modifier = Shortcut::SUPER;
    } else {
        return false;
    }
    return true;
}

// GDK key names are case sensitive; map the spellings people type.
std::string canonical_key_name(const std::string &key) {
    if (key.size() == 1) return to_lower(key);

    static const std::pair<const char *, const char *> NAMES[] = {
        {"space", "space"},         {"tab", "Tab"},
        {"return", "Return"},       {"enter", "Return"},
        {"escape", "Escape"},       {"esc", "Escape"},
        {"backspace", "BackSpace"}, {"delete", "Delete"},
        {"insert", "Insert"},       {"home", "Home"},
        {"end", "End"},             {"page_up", "Page_Up"},
        {"pageup", "Page_Up"},      {"page_down", "Page_Down"},
        {"pagedown", "Page_Down"},  {"up", "Up"},
        {"down", "Down"},           {"left", "Left"},
        {"right", "Right"},         {"comma", "comma"},
        {"period", "period"},       {"slash", "slash"},
        {"minus", "minus"},         {"equal", "equal"},
        {"pause", "Pause"},         {"print", "Print"},
    };

    const std::string lower = to_lower(key);
    for (const auto &name : NAMES) {
        if (lower == name.first) return name.second;
    }
    if (lower.size() >= 2 && lower[0] == 'f' &&
        std::all_of(lower.begin() + 1, lower.end(),
                    [](unsigned char c) { return std::isdigit(c); })) {
        return "F" + lower.substr(1);
    }
    return key;
}

} // namespace

std::string Shortcut::accelerator() const {
    std::string result;
    if (modifiers & CTRL) result += "<Ctrl>";
    if (modifiers & ALT) result += "<Alt>";
    if (modifiers & SHIFT) result += "<Shift>";
    if (modifiers & SUPER) result += "<Super>";
    return result + key;
}

bool Shortcut::same_combination(const Shortcut &other) const {
    return modifiers == other.modifiers && to_lower(key) == to_lower(other.key);
}

bool parse_shortcut(const std::string &text, Shortcut *shortcut,
                    GError **error) {
    const std::string input = trim(text);
    Shortcut parsed;
    std::string key;

    if (!input.empty() && input[0] == '<') {
        size_t pos = 0;
        while (pos < input.size() && input[pos] == '<') {
            const size_t close = input.find('>', pos);
            if (close == std::string::npos) {
                g_set_error(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG,
                            "Unterminated modifier in shortcut '%s'",
                            text.c_str());
                return false;
            }
            unsigned modifier = 0;
            const std::string name = input.substr(pos + 1, close - pos - 1);
            if (!modifier_from_name(name, &modifier)) {
                g_set_error(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG,
                            "Unknown modifier '%s' in shortcut '%s'",
                            name.c_str(), text.c_str());
                return false;
            }
            parsed.modifiers |= modifier;
            pos = close + 1;
        }
        key = trim(input.substr(pos));
    } else {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            const size_t plus = input.find('+', start);
            parts.push_back(trim(input.substr(start, plus - start)));
            if (plus == std::string::npos) break;
            start = plus + 1;
        }
        key = parts.back();
        parts.pop_back();
        for (const auto &name : parts) {
            unsigned modifier = 0;
            if (!modifier_from_name(name, &modifier)) {
                g_set_error(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG,
                            "Unknown modifier '%s' in shortcut '%s'",
                            name.c_str(), text.c_str());
                return false;
            }
            parsed.modifiers |= modifier;
        }
    }

    if (key.empty()) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Shortcut '%s' has no key", text.c_str());
        return false;
    }

    parsed.key = canonical_key_name(key);
    *shortcut = parsed;
    return true;
}

bool normalize_shortcuts(std::map<Action, std::string> *bindings,
                         GError **error) {
    std::map<Action, std::string> normalized;
    std::vector<std::pair<Action, Shortcut>> seen;

    for (const auto &binding : *bindings) {
        if (trim(binding.second).empty()) {
            normalized[binding.first] = "";
            continue;
        }

        Shortcut shortcut;
        if (!parse_shortcut(binding.second, &shortcut, error)) return false;

        for (const auto &other : seen) {
            if (other.second.same_combination(shortcut)) {
                g_set_error(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG,
                            "'%s' and '%s' are both bound to %s",
                            action_label(other.first),
                            action_label(binding.first),
                            shortcut.accelerator().c_str());
                return false;
            }
        }
        seen.emplace_back(binding.first, shortcut);
        normalized[binding.first] = shortcut.accelerator();
    }

    *bindings = std::move(normalized);
    return true;
}

} // namespace whispertrigger
