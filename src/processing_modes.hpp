#pragma once

#include <glib.h>

#include <map>
#include <string>
#include <vector>

namespace whispertrigger {

enum class ModeKind { Verbatim, Cleaned, Rewrite };

const char *mode_kind_name(ModeKind kind);
bool mode_kind_from_name(const std::string &name, ModeKind *kind);

struct ProcessingMode {
    std::string name;
    std::string description;
    std::string instructions;
    ModeKind kind = ModeKind::Cleaned;
};

// Built-in modes plus the user's <config dir>/modes/*.json files.
class ModeCatalog {
public:
    static constexpr const char *DEFAULT_MODE = "default";

    ModeCatalog();

    // Custom modes override built-ins of the same name. Malformed files are
    // logged and skipped; returns the number of modes loaded.
    int load_directory(const std::string &dir);

    // Unknown names resolve to the default mode.
    const ProcessingMode &find(const std::string &name) const;
    bool contains(const std::string &name) const;

    std::vector<std::string> names() const;
    bool is_builtin(const std::string &name) const;

    void add(ProcessingMode mode);

    // Writes <dir>/<name>.json and adds or replaces the mode.
    bool save_mode(const std::string &dir, const ProcessingMode &mode,
                   GError **error);
    // Deletes the mode's file. A built-in mode reverts to its built-in
    // definition; "default" cannot be removed.
    bool remove_mode(const std::string &dir, const std::string &name,
                     GError **error);

private:
    std::map<std::string, ProcessingMode> builtins_;
    std::map<std::string, ProcessingMode> modes_;
};

// Mode names double as file names: letters, digits, '-' and '_'.
bool valid_mode_name(const std::string &name);

bool processing_mode_from_json(const std::string &data, ProcessingMode *mode,
                               GError **error);
std::string processing_mode_to_json(const ProcessingMode &mode);

} // namespace whispertrigger
