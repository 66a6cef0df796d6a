#include "config_store.hpp"

#include "errors.hpp"
#include "shortcut.hpp"

#include <json-glib/json-glib.h>

#include <cerrno>

namespace whispertrigger {

namespace {

constexpr Action ALL_ACTIONS[] = {Action::ToggleRecording,
                                  Action::TranscribeLast,
                                  Action::OpenSettings, Action::Quit};

// --- JSON member readers ---
// An absent or null member leaves the output untouched; only a member of
// the wrong type is an error.

JsonNode *value_member(JsonObject *obj, const char *name) {
    if (!json_object_has_member(obj, name)) return nullptr;
    JsonNode *node = json_object_get_member(obj, name);
    if (node == nullptr || JSON_NODE_HOLDS_NULL(node)) return nullptr;
    return node;
}

bool type_error(const char *name, const char *expected, GError **error) {
    g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                "Setting '%s' must be %s", name, expected);
    return false;
}

bool read_string(JsonObject *obj, const char *name, std::string *out,
                 GError **error) {
    JsonNode *node = value_member(obj, name);
    if (node == nullptr) return true;
    if (!JSON_NODE_HOLDS_VALUE(node) ||
        json_node_get_value_type(node) != G_TYPE_STRING)
        return type_error(name, "a string", error);
    *out = json_node_get_string(node);
    return true;
}

bool read_int(JsonObject *obj, const char *name, int *out, GError **error) {
    JsonNode *node = value_member(obj, name);
    if (node == nullptr) return true;
    if (!JSON_NODE_HOLDS_VALUE(node) ||
        json_node_get_value_type(node) != G_TYPE_INT64)
        return type_error(name, "an integer", error);
    const gint64 value = json_node_get_int(node);
    if (value < G_MININT || value > G_MAXINT) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Setting '%s' is out of range (%" G_GINT64_FORMAT ")",
                    name, value);
        return false;
    }
    *out = static_cast<int>(value);
    return true;
}

bool read_double(JsonObject *obj, const char *name, double *out,
                 GError **error) {
    JsonNode *node = value_member(obj, name);
    if (node == nullptr) return true;
    if (!JSON_NODE_HOLDS_VALUE(node)) return type_error(name, "a number", error);
    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_DOUBLE) {
        *out = json_node_get_double(node);
    } else if (type == G_TYPE_INT64) {
        *out = static_cast<double>(json_node_get_int(node));
    } else {
        return type_error(name, "a number", error);
    }
    return true;
}

bool read_bool(JsonObject *obj, const char *name, bool *out, GError **error) {
    JsonNode *node = value_member(obj, name);
    if (node == nullptr) return true;
    if (!JSON_NODE_HOLDS_VALUE(node) ||
        json_node_get_value_type(node) != G_TYPE_BOOLEAN)
        return type_error(name, "true or false", error);
    *out = json_node_get_boolean(node) != FALSE;
    return true;
}

bool read_object(JsonObject *obj, const char *name, JsonObject **out,
                 GError **error) {
    *out = nullptr;
    JsonNode *node = value_member(obj, name);
    if (node == nullptr) return true;
    if (!JSON_NODE_HOLDS_OBJECT(node)) return type_error(name, "an object", error);
    *out = json_node_get_object(node);
    return true;
}

} // namespace

// --- Serialization ---

bool configuration_from_json(const std::string &data, Configuration *config,
                             GError **error) {
    JsonParser *parser = json_parser_new();
    GError *parse_error = nullptr;
    if (!json_parser_load_from_data(parser, data.c_str(),
                                    static_cast<gssize>(data.size()),
                                    &parse_error)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Invalid configuration JSON: %s", parse_error->message);
        g_error_free(parse_error);
        g_object_unref(parser);
        return false;
    }

    JsonNode *root = json_parser_get_root(parser);
    if (root == nullptr || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Configuration must be a JSON object");
        g_object_unref(parser);
        return false;
    }
    JsonObject *obj = json_node_get_object(root);

    Configuration parsed;
    std::string model = model_size_name(parsed.model_size);
    std::string device = device_preference_name(parsed.device);
    JsonObject *hotkeys = nullptr;
    JsonObject *audio = nullptr;
    JsonObject *rewrite = nullptr;

    bool ok = read_string(obj, "model", &model, error) &&
              read_string(obj, "language", &parsed.language, error) &&
              read_string(obj, "device", &device, error) &&
              read_string(obj, "active_mode", &parsed.processing_mode,
                          error) &&
              read_string(obj, "instructions", &parsed.instruction_text,
                          error) &&
              read_bool(obj, "inject_text", &parsed.inject_text, error) &&
              read_string(obj, "audio_device", &parsed.audio_device, error) &&
              read_string(obj, "models_dir", &parsed.models_dir, error) &&
              read_object(obj, "hotkeys", &hotkeys, error) &&
              read_object(obj, "audio", &audio, error) &&
              read_object(obj, "rewrite", &rewrite, error);

    if (ok && hotkeys != nullptr) {
        for (Action action : ALL_ACTIONS) {
            ok = read_string(hotkeys, action_key(action),
                             &parsed.shortcuts[action], error);
            if (!ok) break;
        }
        // Configs written before "transcribe last" replaced file transcription
        if (ok && !json_object_has_member(hotkeys, "transcribe_last")) {
            ok = read_string(hotkeys, "transcribe_file",
                             &parsed.shortcuts[Action::TranscribeLast], error);
        }
    }

    if (ok && audio != nullptr) {
        ok = read_int(audio, "min_duration_ms", &parsed.min_duration_ms,
                      error) &&
             read_int(audio, "max_duration_s", &parsed.max_duration_s,
                      error) &&
             read_int(audio, "silence_threshold", &parsed.silence_threshold,
                      error) &&
             read_double(audio, "silence_duration",
                         &parsed.silence_duration_s, error);
    }

    if (ok && rewrite != nullptr) {
        ok = read_string(rewrite, "endpoint", &parsed.rewrite.endpoint,
                         error) &&
             read_string(rewrite, "model", &parsed.rewrite.model, error) &&
             read_string(rewrite, "api_key", &parsed.rewrite.api_key,
                         error) &&
             read_int(rewrite, "timeout_s", &parsed.rewrite.timeout_s, error);
    }

    g_object_unref(parser);
    if (!ok) return false;

    if (!model_size_from_name(model, &parsed.model_size)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Unknown model size '%s'", model.c_str());
        return false;
    }
    if (!device_preference_from_name(device, &parsed.device)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Unknown compute device '%s'", device.c_str());
        return false;
    }

    *config = std::move(parsed);
    return true;
}

std::string configuration_to_json(const Configuration &config) {
    JsonBuilder *builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "model");
    json_builder_add_string_value(builder, model_size_name(config.model_size));
    json_builder_set_member_name(builder, "language");
    json_builder_add_string_value(builder, config.language.c_str());
    json_builder_set_member_name(builder, "device");
    json_builder_add_string_value(builder,
                                  device_preference_name(config.device));
    json_builder_set_member_name(builder, "active_mode");
    json_builder_add_string_value(builder, config.processing_mode.c_str());
    json_builder_set_member_name(builder, "instructions");
    json_builder_add_string_value(builder, config.instruction_text.c_str());
    json_builder_set_member_name(builder, "inject_text");
    json_builder_add_boolean_value(builder, config.inject_text);
    json_builder_set_member_name(builder, "audio_device");
    json_builder_add_string_value(builder, config.audio_device.c_str());
    json_builder_set_member_name(builder, "models_dir");
    json_builder_add_string_value(builder, config.models_dir.c_str());

    json_builder_set_member_name(builder, "hotkeys");
    json_builder_begin_object(builder);
    for (Action action : ALL_ACTIONS) {
        auto it = config.shortcuts.find(action);
        json_builder_set_member_name(builder, action_key(action));
        json_builder_add_string_value(
            builder, it != config.shortcuts.end() ? it->second.c_str() : "");
    }
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "audio");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "min_duration_ms");
    json_builder_add_int_value(builder, config.min_duration_ms);
    json_builder_set_member_name(builder, "max_duration_s");
    json_builder_add_int_value(builder, config.max_duration_s);
    json_builder_set_member_name(builder, "silence_threshold");
    json_builder_add_int_value(builder, config.silence_threshold);
    json_builder_set_member_name(builder, "silence_duration");
    json_builder_add_double_value(builder, config.silence_duration_s);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "rewrite");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "endpoint");
    json_builder_add_string_value(builder, config.rewrite.endpoint.c_str());
    json_builder_set_member_name(builder, "model");
    json_builder_add_string_value(builder, config.rewrite.model.c_str());
    json_builder_set_member_name(builder, "api_key");
    json_builder_add_string_value(builder, config.rewrite.api_key.c_str());
    json_builder_set_member_name(builder, "timeout_s");
    json_builder_add_int_value(builder, config.rewrite.timeout_s);
    json_builder_end_object(builder);

    json_builder_end_object(builder);

    JsonNode *root = json_builder_get_root(builder);
    JsonGenerator *generator = json_generator_new();
    json_generator_set_root(generator, root);
    json_generator_set_pretty(generator, TRUE);
    json_generator_set_indent(generator, 4);

    gchar *data = json_generator_to_data(generator, nullptr);
    std::string result(data);

    g_free(data);
    g_object_unref(generator);
    json_node_unref(root);
    g_object_unref(builder);
    return result;
}

// --- ConfigStore ---

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

std::string ConfigStore::default_path() {
    gchar *path = g_build_filename(g_get_user_config_dir(), "whispertrigger",
                                   "config.json", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

bool ConfigStore::load(GError **error) {
    if (!g_file_test(path_.c_str(), G_FILE_TEST_EXISTS)) {
        g_message("No configuration at %s, writing defaults", path_.c_str());
        return save(current_, error);
    }

    gchar *contents = nullptr;
    gsize length = 0;
    if (!g_file_get_contents(path_.c_str(), &contents, &length, error))
        return false;

    Configuration loaded;
    std::string data(contents, length);
    g_free(contents);

    if (!configuration_from_json(data, &loaded, error) ||
        !validate(&loaded, false, error)) {
        return false;
    }

    current_ = std::move(loaded);
    g_message("Loaded configuration from %s", path_.c_str());
    return true;
}

bool ConfigStore::commit(const Configuration &candidate, GError **error) {
    Configuration next = candidate;
    if (!validate(&next, true, error)) return false;
    if (!save(next, error)) return false;

    Configuration previous = std::move(current_);
    current_ = std::move(next);
    g_message("Configuration saved to %s", path_.c_str());

    for (const auto &observer : observers_) {
        observer(previous, current_);
    }
    return true;
}

void ConfigStore::add_validator(Validator validator) {
    validators_.push_back(std::move(validator));
}

void ConfigStore::subscribe(Observer observer) {
    observers_.push_back(std::move(observer));
}

bool ConfigStore::validate(Configuration *candidate, bool run_validators,
                           GError **error) const {
    if (!normalize_shortcuts(&candidate->shortcuts, error)) return false;

    const char *problem = nullptr;
    if (candidate->language.empty()) {
        problem = "Language must not be empty";
    } else if (candidate->processing_mode.empty()) {
        problem = "A processing mode must be selected";
    } else if (candidate->min_duration_ms < 0) {
        problem = "Minimum recording duration must not be negative";
    } else if (candidate->max_duration_s <= 0) {
        problem = "Maximum recording duration must be positive";
    } else if (candidate->min_duration_ms >=
               static_cast<gint64>(candidate->max_duration_s) * 1000) {
        problem = "Minimum recording duration must be below the maximum";
    } else if (candidate->silence_duration_s < 0.0) {
        problem = "Silence duration must not be negative";
    } else if (candidate->rewrite.timeout_s <= 0) {
        problem = "Rewrite timeout must be positive";
    }
    if (problem != nullptr) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG, problem);
        return false;
    }

    if (run_validators) {
        for (const auto &validator : validators_) {
            if (!validator(*candidate, error)) return false;
        }
    }
    return true;
}

bool ConfigStore::save(const Configuration &config, GError **error) const {
    gchar *dir = g_path_get_dirname(path_.c_str());
    if (g_mkdir_with_parents(dir, 0700) != 0) {
        g_set_error(error, G_FILE_ERROR, g_file_error_from_errno(errno),
                    "Cannot create %s: %s", dir, g_strerror(errno));
        g_free(dir);
        return false;
    }
    g_free(dir);

    const std::string data = configuration_to_json(config);
    return g_file_set_contents(path_.c_str(), data.c_str(),
                               static_cast<gssize>(data.size()), error) != FALSE;
}

} // namespace whispertrigger
