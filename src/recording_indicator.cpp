#include "recording_indicator.hpp"

namespace whispertrigger {

RecordingIndicator::RecordingIndicator() {
    window_ = gtk_window_new(GTK_WINDOW_POPUP);
    gtk_window_set_decorated(GTK_WINDOW(window_), FALSE);
    gtk_window_set_keep_above(GTK_WINDOW(window_), TRUE);
    gtk_window_set_skip_taskbar_hint(GTK_WINDOW(window_), TRUE);
    gtk_window_set_accept_focus(GTK_WINDOW(window_), FALSE);
    gtk_window_set_default_size(GTK_WINDOW(window_), 240, -1);
    gtk_window_set_position(GTK_WINDOW(window_), GTK_WIN_POS_CENTER);

    GtkWidget *box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_container_set_border_width(GTK_CONTAINER(box), 10);
    gtk_container_add(GTK_CONTAINER(window_), box);

    label_ = gtk_label_new("Recording...");
    gtk_box_pack_start(GTK_BOX(box), label_, FALSE, FALSE, 0);

    level_bar_ = gtk_level_bar_new_for_interval(0.0, 1.0);
    gtk_level_bar_set_mode(GTK_LEVEL_BAR(level_bar_),
                           GTK_LEVEL_BAR_MODE_CONTINUOUS);
    gtk_level_bar_remove_offset_value(GTK_LEVEL_BAR(level_bar_),
                                      GTK_LEVEL_BAR_OFFSET_LOW);
    gtk_level_bar_remove_offset_value(GTK_LEVEL_BAR(level_bar_),
                                      GTK_LEVEL_BAR_OFFSET_HIGH);
    gtk_level_bar_remove_offset_value(GTK_LEVEL_BAR(level_bar_),
                                      GTK_LEVEL_BAR_OFFSET_FULL);
    gtk_box_pack_start(GTK_BOX(box), level_bar_, FALSE, FALSE, 0);

    gtk_widget_show_all(box);
}

RecordingIndicator::~RecordingIndicator() {
    if (window_ != nullptr) {
        gtk_widget_destroy(window_);
        window_ = nullptr;
    }
}

void RecordingIndicator::show(const char *status) {
    gtk_label_set_text(GTK_LABEL(label_), status);
    gtk_level_bar_set_value(GTK_LEVEL_BAR(level_bar_), 0.0);
    gtk_widget_show(window_);
}

void RecordingIndicator::hide() {
    gtk_level_bar_set_value(GTK_LEVEL_BAR(level_bar_), 0.0);
    gtk_widget_hide(window_);
}

void RecordingIndicator::set_level(double level) {
    gtk_level_bar_set_value(GTK_LEVEL_BAR(level_bar_), level);
}

} // namespace whispertrigger
