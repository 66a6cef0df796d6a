#pragma once

#include <gtk/gtk.h>

namespace whispertrigger {

// Small undecorated window with a status label and input level bar, shown
// while recording.
class RecordingIndicator {
public:
    RecordingIndicator();
    ~RecordingIndicator();

    RecordingIndicator(const RecordingIndicator &) = delete;
    RecordingIndicator &operator=(const RecordingIndicator &) = delete;

    void show(const char *status);
    void hide();
    void set_level(double level);

private:
    GtkWidget *window_ = nullptr;
    GtkWidget *label_ = nullptr;
    GtkWidget *level_bar_ = nullptr;
};

} // namespace whispertrigger
