#include "soup_text_generator.hpp"

#include "errors.hpp"

#include <json-glib/json-glib.h>

#include <memory>

namespace whispertrigger {

namespace {

struct PendingRequest {
    SoupMessage *msg = nullptr;
    TextGenerator::Callback callback;

    ~PendingRequest() {
        if (msg != nullptr) g_object_unref(msg);
    }
};

std::string resolve_api_key(const RewriteSettings &settings) {
    if (!settings.api_key.empty()) return settings.api_key;
    const char *env_key = g_getenv("MISTRAL_API_KEY");
    if (env_key != nullptr && env_key[0] != '\0') return env_key;
    return "";
}

void fail(const TextGenerator::Callback &callback, const char *message) {
    GError *error = g_error_new_literal(
        WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_REWRITE, message);
    callback("", error);
    g_error_free(error);
}

} // namespace

SoupTextGenerator::SoupTextGenerator(const ConfigStore &config)
    : config_(config),
      session_(soup_session_new()),
      cancellable_(g_cancellable_new()) {}

SoupTextGenerator::~SoupTextGenerator() {
    g_cancellable_cancel(cancellable_);
    g_object_unref(cancellable_);
    g_object_unref(session_);
}

void SoupTextGenerator::generate(const std::string &instructions,
                                 const std::string &text, Callback callback) {
    const RewriteSettings &settings = config_.current().rewrite;

    const std::string key = resolve_api_key(settings);
    if (key.empty()) {
        fail(callback, "No API key configured (set MISTRAL_API_KEY)");
        return;
    }

    SoupMessage *msg = soup_message_new("POST", settings.endpoint.c_str());
    if (msg == nullptr) {
        fail(callback, "Invalid rewrite endpoint URL");
        return;
    }

    const std::string body = build_chat_request(settings.model, instructions,
                                                text);
    GBytes *bytes = g_bytes_new(body.data(), body.size());
    soup_message_set_request_body_from_bytes(msg, "application/json", bytes);
    g_bytes_unref(bytes);

    SoupMessageHeaders *headers = soup_message_get_request_headers(msg);
    std::string auth = "Bearer " + key;
    soup_message_headers_replace(headers, "Authorization", auth.c_str());

    soup_session_set_timeout(session_,
                             static_cast<guint>(settings.timeout_s));

    auto *request = new PendingRequest();
    request->msg = msg;
    request->callback = std::move(callback);

    soup_session_send_and_read_async(session_, msg, G_PRIORITY_DEFAULT,
                                     cancellable_, on_response, request);
}

void SoupTextGenerator::on_response(GObject *source, GAsyncResult *result,
                                    gpointer userdata) {
    std::unique_ptr<PendingRequest> request(
        static_cast<PendingRequest *>(userdata));

    GError *error = nullptr;
    GBytes *response_bytes = soup_session_send_and_read_finish(
        SOUP_SESSION(source), result, &error);

    if (error != nullptr) {
        // Generator destroyed; nobody is waiting for the answer
        if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED)) {
            g_error_free(error);
            return;
        }
        GError *wrapped = g_error_new(WHISPERTRIGGER_ERROR,
                                      WHISPERTRIGGER_ERROR_REWRITE,
                                      "Network error: %s", error->message);
        g_error_free(error);
        request->callback("", wrapped);
        g_error_free(wrapped);
        return;
    }

    gsize response_len = 0;
    const char *response_data = static_cast<const char *>(
        g_bytes_get_data(response_bytes, &response_len));
    const std::string data(response_data != nullptr ? response_data : "",
                           response_len);
    g_bytes_unref(response_bytes);

    const guint status = soup_message_get_status(request->msg);
    std::string content;
    if (!parse_chat_response(data, &content, &error)) {
        if (status >= 400) g_prefix_error(&error, "HTTP %u: ", status);
        request->callback("", error);
        g_error_free(error);
        return;
    }

    request->callback(content, nullptr);
}

std::string build_chat_request(const std::string &model,
                               const std::string &instructions,
                               const std::string &text) {
    JsonBuilder *builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "model");
    json_builder_add_string_value(builder, model.c_str());
    json_builder_set_member_name(builder, "temperature");
    json_builder_add_double_value(builder, 0.2);

    json_builder_set_member_name(builder, "messages");
    json_builder_begin_array(builder);
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "role");
    json_builder_add_string_value(builder, "system");
    json_builder_set_member_name(builder, "content");
    json_builder_add_string_value(builder, instructions.c_str());
    json_builder_end_object(builder);
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "role");
    json_builder_add_string_value(builder, "user");
    json_builder_set_member_name(builder, "content");
    json_builder_add_string_value(builder, text.c_str());
    json_builder_end_object(builder);
    json_builder_end_array(builder);
    json_builder_end_object(builder);

    JsonNode *root = json_builder_get_root(builder);
    JsonGenerator *gen = json_generator_new();
    json_generator_set_root(gen, root);
    gchar *json = json_generator_to_data(gen, nullptr);
    std::string result(json);

    g_free(json);
    g_object_unref(gen);
    json_node_unref(root);
    g_object_unref(builder);
    return result;
}

bool parse_chat_response(const std::string &data, std::string *content,
                         GError **error) {
    JsonParser *parser = json_parser_new();
    GError *parse_error = nullptr;
    if (!json_parser_load_from_data(parser, data.c_str(),
                                    static_cast<gssize>(data.size()),
                                    &parse_error)) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_REWRITE,
                    "Invalid response: %s", parse_error->message);
        g_error_free(parse_error);
        g_object_unref(parser);
        return false;
    }

    JsonNode *root = json_parser_get_root(parser);
    if (root == nullptr || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_REWRITE,
                            "Invalid response: not an object");
        g_object_unref(parser);
        return false;
    }
    JsonObject *obj = json_node_get_object(root);

    // {"message": "..."} or {"error": {"message": "..."}}
    const char *err_msg = nullptr;
    if (json_object_has_member(obj, "error")) {
        JsonNode *err = json_object_get_member(obj, "error");
        if (JSON_NODE_HOLDS_OBJECT(err) &&
            json_object_has_member(json_node_get_object(err), "message")) {
            err_msg = json_object_get_string_member(json_node_get_object(err),
                                                    "message");
        } else if (JSON_NODE_HOLDS_VALUE(err)) {
            err_msg = json_node_get_string(err);
        }
    } else if (json_object_has_member(obj, "message") &&
               !json_object_has_member(obj, "choices")) {
        err_msg = json_object_get_string_member(obj, "message");
    }
    if (err_msg != nullptr) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_REWRITE,
                    "API error: %s", err_msg);
        g_object_unref(parser);
        return false;
    }

    const char *text = nullptr;
    JsonArray *choices = json_object_has_member(obj, "choices")
                             ? json_object_get_array_member(obj, "choices")
                             : nullptr;
    if (choices != nullptr && json_array_get_length(choices) > 0) {
        JsonObject *choice = json_array_get_object_element(choices, 0);
        if (choice != nullptr && json_object_has_member(choice, "message")) {
            JsonObject *message =
                json_object_get_object_member(choice, "message");
            if (message != nullptr &&
                json_object_has_member(message, "content")) {
                text = json_object_get_string_member(message, "content");
            }
        }
    }

    if (text == nullptr) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_REWRITE,
                            "No text in response");
        g_object_unref(parser);
        return false;
    }

    *content = text;
    g_object_unref(parser);
    return true;
}

} // namespace whispertrigger
