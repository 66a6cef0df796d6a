#pragma once

#include "output_sink.hpp"

struct xdo;

namespace whispertrigger {

enum class TypingTool { NONE, XDO, WTYPE, YDOTOOL, XDOTOOL };

// libxdo on X11; on Wayland the first working command line tool.
class XdoInjector : public TextInjector {
public:
    XdoInjector();
    ~XdoInjector() override;

    XdoInjector(const XdoInjector &) = delete;
    XdoInjector &operator=(const XdoInjector &) = delete;

    TypingTool tool() const { return tool_; }

    void remember_focus() override;
    std::string focus_title() const override;
    bool type_text(const std::string &text, GError **error) override;

private:
    bool spawn_tool(const char *const *argv, GError **error);

    TypingTool tool_ = TypingTool::NONE;
    struct xdo *xdo_ = nullptr;
    unsigned long focused_window_ = 0;
};

} // namespace whispertrigger
