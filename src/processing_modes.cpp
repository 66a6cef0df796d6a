#include "processing_modes.hpp"

#include "errors.hpp"

#include <glib/gstdio.h>
#include <json-glib/json-glib.h>

#include <cerrno>

namespace whispertrigger {

namespace {

const char *const DEFAULT_INSTRUCTIONS =
    "Process the transcribed text as follows:\n\n"
    "1. Correct any grammar or spelling errors\n"
    "2. Format the text properly with punctuation\n"
    "3. Return the processed text";

} // namespace

const char *mode_kind_name(ModeKind kind) {
    switch (kind) {
    case ModeKind::Verbatim:
        return "verbatim";
    case ModeKind::Cleaned:
        return "cleaned";
    case ModeKind::Rewrite:
        return "rewrite";
    }
    return "";
}

bool mode_kind_from_name(const std::string &name, ModeKind *kind) {
    if (name == "verbatim") {
        *kind = ModeKind::Verbatim;
    } else if (name == "cleaned") {
        *kind = ModeKind::Cleaned;
    } else if (name == "rewrite") {
        *kind = ModeKind::Rewrite;
    } else {
        return false;
    }
    return true;
}

ModeCatalog::ModeCatalog() {
    add({"default", "Default processing mode", DEFAULT_INSTRUCTIONS,
         ModeKind::Cleaned});
    add({"formatting",
         "Format text with proper capitalization and punctuation",
         "Process the transcribed text as follows:\n\n"
         "1. Capitalize the first letter of each sentence\n"
         "2. Add proper punctuation\n"
         "3. Format lists and paragraphs\n"
         "4. Do not change the content or meaning",
         ModeKind::Cleaned});
    add({"raw", "Raw transcription without processing",
         "Return the transcribed text exactly as is, without any processing "
         "or modifications.",
         ModeKind::Verbatim});
    add({"notes", "Format as meeting notes",
         "Process the transcribed text as follows:\n\n"
         "1. Format as meeting notes\n"
         "2. Add bullet points for key items\n"
         "3. Organize into sections if multiple topics are discussed\n"
         "4. Highlight action items and decisions",
         ModeKind::Rewrite});
    add({"email", "Format as a professional email",
         "Process the transcribed text as follows:\n\n"
         "1. Format as a professional email\n"
         "2. Add appropriate greeting and closing\n"
         "3. Organize content into clear paragraphs\n"
         "4. Maintain a professional tone",
         ModeKind::Rewrite});
    add({"code", "Format as code or technical content",
         "Process the transcribed text as follows:\n\n"
         "1. Format as code or technical documentation\n"
         "2. Preserve code syntax and structure\n"
         "3. Use proper technical terminology\n"
         "4. Format variable names and functions correctly",
         ModeKind::Rewrite});
    builtins_ = modes_;
}

void ModeCatalog::add(ProcessingMode mode) {
    std::string name = mode.name;
    modes_[name] = std::move(mode);
}

bool ModeCatalog::is_builtin(const std::string &name) const {
    return builtins_.count(name) != 0;
}

bool ModeCatalog::save_mode(const std::string &dir, const ProcessingMode &mode,
                            GError **error) {
    if (!valid_mode_name(mode.name)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Invalid mode name '%s' (use letters, digits, '-' or '_')",
                    mode.name.c_str());
        return false;
    }
    if (g_mkdir_with_parents(dir.c_str(), 0700) != 0) {
        g_set_error(error, G_FILE_ERROR, g_file_error_from_errno(errno),
                    "Cannot create %s: %s", dir.c_str(), g_strerror(errno));
        return false;
    }

    const std::string file = mode.name + ".json";
    gchar *path = g_build_filename(dir.c_str(), file.c_str(), nullptr);
    const std::string data = processing_mode_to_json(mode);
    const bool ok = g_file_set_contents(path, data.c_str(),
                                        static_cast<gssize>(data.size()),
                                        error) != FALSE;
    if (ok) g_message("Saved mode %s to %s", mode.name.c_str(), path);
    g_free(path);
    if (!ok) return false;

    add(mode);
    return true;
}

bool ModeCatalog::remove_mode(const std::string &dir, const std::string &name,
                              GError **error) {
    if (name == DEFAULT_MODE) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG,
                            "The default mode cannot be deleted");
        return false;
    }
    if (!contains(name)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Unknown processing mode '%s'", name.c_str());
        return false;
    }

    if (valid_mode_name(name)) {
        const std::string file = name + ".json";
        gchar *path = g_build_filename(dir.c_str(), file.c_str(), nullptr);
        if (g_unlink(path) != 0 && errno != ENOENT) {
            const int saved = errno;
            g_set_error(error, G_FILE_ERROR, g_file_error_from_errno(saved),
                        "Cannot delete %s: %s", path, g_strerror(saved));
            g_free(path);
            return false;
        }
        g_free(path);
    }

    auto builtin = builtins_.find(name);
    if (builtin != builtins_.end()) {
        modes_[name] = builtin->second;
        g_message("Mode %s reverted to its built-in definition", name.c_str());
    } else {
        modes_.erase(name);
        g_message("Deleted mode %s", name.c_str());
    }
    return true;
}

bool valid_mode_name(const std::string &name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!g_ascii_isalnum(c) && c != '-' && c != '_') return false;
    }
    return true;
}

int ModeCatalog::load_directory(const std::string &dir) {
    GError *error = nullptr;
    GDir *handle = g_dir_open(dir.c_str(), 0, &error);
    if (handle == nullptr) {
        if (!g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT))
            g_warning("Cannot read modes directory %s: %s", dir.c_str(),
                      error->message);
        g_error_free(error);
        return 0;
    }

    int loaded = 0;
    const char *entry;
    while ((entry = g_dir_read_name(handle)) != nullptr) {
        if (!g_str_has_suffix(entry, ".json")) continue;

        gchar *path = g_build_filename(dir.c_str(), entry, nullptr);
        gchar *contents = nullptr;
        gsize length = 0;
        ProcessingMode mode;

        if (!g_file_get_contents(path, &contents, &length, &error) ||
            !processing_mode_from_json(std::string(contents, length), &mode,
                                       &error)) {
            g_warning("Skipping mode file %s: %s", path, error->message);
            g_clear_error(&error);
        } else {
            g_message("Loaded mode: %s", mode.name.c_str());
            add(std::move(mode));
            loaded++;
        }

        g_free(contents);
        g_free(path);
    }
    g_dir_close(handle);
    return loaded;
}

const ProcessingMode &ModeCatalog::find(const std::string &name) const {
    auto it = modes_.find(name);
    if (it != modes_.end()) return it->second;

    g_debug("Unknown processing mode '%s', using %s", name.c_str(),
            DEFAULT_MODE);
    return modes_.at(DEFAULT_MODE);
}

bool ModeCatalog::contains(const std::string &name) const {
    return modes_.count(name) != 0;
}

std::vector<std::string> ModeCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(modes_.size());
    for (const auto &entry : modes_) result.push_back(entry.first);
    return result;
}

bool processing_mode_from_json(const std::string &data, ProcessingMode *mode,
                               GError **error) {
    JsonParser *parser = json_parser_new();
    GError *parse_error = nullptr;
    if (!json_parser_load_from_data(parser, data.c_str(),
                                    static_cast<gssize>(data.size()),
                                    &parse_error)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Invalid JSON: %s", parse_error->message);
        g_error_free(parse_error);
        g_object_unref(parser);
        return false;
    }

    JsonNode *root = json_parser_get_root(parser);
    if (root == nullptr || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG,
                            "Mode file is not a JSON object");
        g_object_unref(parser);
        return false;
    }

    JsonObject *obj = json_node_get_object(root);
    ProcessingMode parsed;
    bool ok = true;

    auto read_string = [&](const char *member, std::string *out) {
        if (!ok || !json_object_has_member(obj, member)) return;
        JsonNode *node = json_object_get_member(obj, member);
        if (JSON_NODE_HOLDS_NULL(node)) return;
        if (!JSON_NODE_HOLDS_VALUE(node) ||
            json_node_get_value_type(node) != G_TYPE_STRING) {
            g_set_error(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_CONFIG,
                        "Member '%s' must be a string", member);
            ok = false;
            return;
        }
        *out = json_node_get_string(node);
    };

    std::string kind;
    read_string("name", &parsed.name);
    read_string("description", &parsed.description);
    read_string("instructions", &parsed.instructions);
    read_string("kind", &kind);
    g_object_unref(parser);
    if (!ok) return false;

    if (parsed.name.empty()) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_CONFIG, "Mode has no name");
        return false;
    }

    // Custom modes carry instructions for the rewrite endpoint
    parsed.kind = ModeKind::Rewrite;
    if (!kind.empty() && !mode_kind_from_name(kind, &parsed.kind)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_CONFIG,
                    "Unknown mode kind '%s'", kind.c_str());
        return false;
    }

    *mode = std::move(parsed);
    return true;
}

std::string processing_mode_to_json(const ProcessingMode &mode) {
    JsonBuilder *builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "name");
    json_builder_add_string_value(builder, mode.name.c_str());
    json_builder_set_member_name(builder, "description");
    json_builder_add_string_value(builder, mode.description.c_str());
    json_builder_set_member_name(builder, "instructions");
    json_builder_add_string_value(builder, mode.instructions.c_str());
    json_builder_set_member_name(builder, "kind");
    json_builder_add_string_value(builder, mode_kind_name(mode.kind));
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

} // namespace whispertrigger
