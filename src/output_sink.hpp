#pragma once

#include <glib.h>

#include <string>

namespace whispertrigger {

class Clipboard {
public:
    virtual ~Clipboard() = default;
    virtual void set_text(const std::string &text) = 0;
};

// Synthetic typing into the window that had focus when recording began.
class TextInjector {
public:
    virtual ~TextInjector() = default;

    virtual void remember_focus() = 0;
    // Title of the remembered window, empty when unknown.
    virtual std::string focus_title() const = 0;
    virtual bool type_text(const std::string &text, GError **error) = 0;
};

enum class Delivery { Empty, ClipboardOnly, Injected, InjectionFailed };

class OutputSink {
public:
    OutputSink(Clipboard &clipboard, TextInjector *injector);

    // Clipboard always; typing when inject is set. On InjectionFailed the
    // notice explains why the text is only on the clipboard.
    Delivery deliver(const std::string &text, bool inject, GError **notice);

private:
    Clipboard &clipboard_;
    TextInjector *injector_;
};

} // namespace whispertrigger
