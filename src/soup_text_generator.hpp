#pragma once

#include "config_store.hpp"
#include "post_processor.hpp"

#include <gio/gio.h>
#include <libsoup/soup.h>

#include <string>

namespace whispertrigger {

// Chat-completions client (Mistral by default) used by rewrite modes.
class SoupTextGenerator : public TextGenerator {
public:
    explicit SoupTextGenerator(const ConfigStore &config);
    ~SoupTextGenerator() override;

    SoupTextGenerator(const SoupTextGenerator &) = delete;
    SoupTextGenerator &operator=(const SoupTextGenerator &) = delete;

    void generate(const std::string &instructions, const std::string &text,
                  Callback callback) override;

private:
    static void on_response(GObject *source, GAsyncResult *result,
                            gpointer userdata);

    const ConfigStore &config_;
    SoupSession *session_ = nullptr;
    GCancellable *cancellable_ = nullptr;
};

std::string build_chat_request(const std::string &model,
                               const std::string &instructions,
                               const std::string &text);

// Extracts choices[0].message.content, or the API's error message.
bool parse_chat_response(const std::string &data, std::string *content,
                         GError **error);

} // namespace whispertrigger
