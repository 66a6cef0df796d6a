#pragma once

#include "configuration.hpp"

#include <glib.h>

#include <functional>
#include <string>
#include <vector>

namespace whispertrigger {

// Owns the committed Configuration and its JSON file. All writes go through
// commit() on the main thread; everybody else reads current().
class ConfigStore {
public:
    using Validator =
        std::function<bool(const Configuration &candidate, GError **error)>;
    using Observer = std::function<void(const Configuration &previous,
                                        const Configuration &current)>;

    explicit ConfigStore(std::string path);

    ConfigStore(const ConfigStore &) = delete;
    ConfigStore &operator=(const ConfigStore &) = delete;

    // $XDG_CONFIG_HOME/whispertrigger/config.json
    static std::string default_path();

    const std::string &path() const { return path_; }
    const Configuration &current() const { return current_; }

    // Reads the file; writes defaults when it does not exist yet. On a
    // malformed file the defaults stay active, the file is left alone and
    // WHISPERTRIGGER_ERROR_CONFIG is returned.
    bool load(GError **error);

    // Validates, persists in full and activates the candidate. On failure
    // nothing changes and the previous configuration stays active.
    bool commit(const Configuration &candidate, GError **error);

    // Extra checks applied by commit(), e.g. that the model file exists.
    void add_validator(Validator validator);
    void subscribe(Observer observer);

private:
    bool validate(Configuration *candidate, bool run_validators,
                  GError **error) const;
    bool save(const Configuration &config, GError **error) const;

    std::string path_;
    Configuration current_;
    std::vector<Validator> validators_;
    std::vector<Observer> observers_;
};

bool configuration_from_json(const std::string &data, Configuration *config,
                             GError **error);
std::string configuration_to_json(const Configuration &config);

} // namespace whispertrigger
