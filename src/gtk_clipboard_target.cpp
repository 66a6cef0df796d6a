#include "gtk_clipboard_target.hpp"

#include <gtk/gtk.h>

namespace whispertrigger {

void GtkClipboardTarget::set_text(const std::string &text) {
    GtkClipboard *clipboard = gtk_clipboard_get(GDK_SELECTION_CLIPBOARD);
    gtk_clipboard_set_text(clipboard, text.c_str(),
                           static_cast<gint>(text.size()));
    gtk_clipboard_store(clipboard);
}

} // namespace whispertrigger
