#include "output_sink.hpp"

#include "errors.hpp"

namespace whispertrigger {

OutputSink::OutputSink(Clipboard &clipboard, TextInjector *injector)
    : clipboard_(clipboard), injector_(injector) {}

Delivery OutputSink::deliver(const std::string &text, bool inject,
                             GError **notice) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        return Delivery::Empty;

    clipboard_.set_text(text);
    if (!inject) return Delivery::ClipboardOnly;

    if (injector_ == nullptr) {
        g_set_error_literal(notice, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_INJECTION,
                            "No typing tool available; text copied to the "
                            "clipboard");
        return Delivery::InjectionFailed;
    }

    GError *error = nullptr;
    if (!injector_->type_text(text, &error)) {
        g_warning("Typing failed: %s", error->message);
        g_set_error(notice, WHISPERTRIGGER_ERROR,
                    WHISPERTRIGGER_ERROR_INJECTION,
                    "%s; text copied to the clipboard", error->message);
        g_error_free(error);
        return Delivery::InjectionFailed;
    }
    return Delivery::Injected;
}

} // namespace whispertrigger
