#include "post_processor.hpp"

#include "errors.hpp"

namespace whispertrigger {

namespace {

bool is_sentence_end(gunichar c) {
    return c == '.' || c == '!' || c == '?' || c == 0x2026;
}

void append_unichar(std::string *out, gunichar c) {
    char buf[6];
    const gint len = g_unichar_to_utf8(c, buf);
    out->append(buf, static_cast<size_t>(len));
}

} // namespace

std::string clean_transcript(const std::string &text) {
    if (!g_utf8_validate(text.c_str(), static_cast<gssize>(text.size()),
                         nullptr)) {
        return text;
    }

    std::string out;
    out.reserve(text.size() + 1);
    bool pending_space = false;
    bool after_terminator = false;
    bool capitalize = true;

    for (const char *p = text.c_str(); *p != '\0'; p = g_utf8_next_char(p)) {
        gunichar c = g_utf8_get_char(p);

        if (g_unichar_isspace(c)) {
            pending_space = !out.empty();
            if (after_terminator) capitalize = true;
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }

        if (capitalize && g_unichar_isalnum(c)) {
            c = g_unichar_toupper(c);
            capitalize = false;
        }
        after_terminator = is_sentence_end(c);
        append_unichar(&out, c);
    }

    if (out.empty()) return out;

    const char *end = out.c_str() + out.size();
    const char *last_pos = g_utf8_prev_char(end);
    const gunichar last = g_utf8_get_char(last_pos);
    if (last == ',' || last == ';' || last == ':') {
        out.replace(static_cast<size_t>(last_pos - out.c_str()),
                    std::string::npos, ".");
    } else if (g_unichar_isalnum(last)) {
        out += '.';
    }
    return out;
}

std::string build_rewrite_prompt(const std::string &instructions,
                                 const std::string &context) {
    if (context.empty()) return instructions;
    return instructions +
           "\n\nThe result will be typed into the window titled \"" +
           context + "\"; match its conventions.";
}

PostProcessor::PostProcessor(const ModeCatalog &catalog,
                             TextGenerator *generator)
    : catalog_(catalog), generator_(generator) {}

void PostProcessor::process(const TranscriptionResult &result,
                            const std::string &instruction_text,
                            const std::string &context, Callback callback) {
    const ProcessingMode &mode = catalog_.find(result.processing_mode);

    switch (mode.kind) {
    case ModeKind::Verbatim:
        callback(result.raw_text, nullptr);
        return;
    case ModeKind::Cleaned:
        callback(clean_transcript(result.raw_text), nullptr);
        return;
    case ModeKind::Rewrite:
        break;
    }

    if (generator_ == nullptr) {
        GError *notice = g_error_new(
            WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_REWRITE,
            "Mode '%s' needs an AI rewrite endpoint; using the raw text",
            mode.name.c_str());
        callback(result.raw_text, notice);
        g_error_free(notice);
        return;
    }

    const std::string &instructions =
        instruction_text.empty() ? mode.instructions : instruction_text;
    const std::string raw_text = result.raw_text;
    const std::string mode_name = mode.name;

    g_debug("Rewriting %zu characters with mode %s", raw_text.size(),
            mode_name.c_str());

    generator_->generate(
        build_rewrite_prompt(instructions, context), raw_text,
        [callback, raw_text, mode_name](const std::string &text,
                                        const GError *error) {
            if (error == nullptr && !text.empty()) {
                callback(text, nullptr);
                return;
            }

            GError *notice = g_error_new(
                WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_REWRITE,
                "Rewrite with mode '%s' failed (%s); using the raw text",
                mode_name.c_str(),
                error != nullptr ? error->message : "empty response");
            g_warning("%s", notice->message);
            callback(raw_text, notice);
            g_error_free(notice);
        });
}

} // namespace whispertrigger
