#pragma once

#include "output_sink.hpp"

namespace whispertrigger {

class GtkClipboardTarget : public Clipboard {
public:
    void set_text(const std::string &text) override;
};

} // namespace whispertrigger
