#pragma once

#include "processing_modes.hpp"
#include "transcription.hpp"

#include <glib.h>

#include <functional>
#include <string>

namespace whispertrigger {

// Asynchronous text-to-text backend for rewrite modes. The callback runs on
// the main loop; error is null on success.
class TextGenerator {
public:
    using Callback =
        std::function<void(const std::string &text, const GError *error)>;

    virtual ~TextGenerator() = default;

    virtual void generate(const std::string &instructions,
                          const std::string &text, Callback callback) = 0;
};

// Trims, collapses whitespace, capitalizes sentences and terminates the
// last one.
std::string clean_transcript(const std::string &text);

// Instructions plus the focused window title, if known.
std::string build_rewrite_prompt(const std::string &instructions,
                                 const std::string &context);

class PostProcessor {
public:
    // notice is set when the mode could not be applied and raw text is
    // returned instead.
    using Callback =
        std::function<void(const std::string &text, const GError *notice)>;

    PostProcessor(const ModeCatalog &catalog, TextGenerator *generator);

    // Verbatim and cleaned modes complete before process() returns.
    void process(const TranscriptionResult &result,
                 const std::string &instruction_text,
                 const std::string &context, Callback callback);

private:
    const ModeCatalog &catalog_;
    TextGenerator *generator_;
};

} // namespace whispertrigger
