#pragma once

#include "audio_source.hpp"
#include "config_store.hpp"
#include "processing_modes.hpp"

#include <gtk/gtk.h>

#include <string>

namespace whispertrigger {

// Modal settings dialog. Save commits through the store; a rejected
// configuration is reported and the dialog stays open. Returns true when a
// new configuration was committed. The Modes tab writes custom modes to
// modes_dir immediately, independent of Save.
bool run_settings_dialog(GtkWindow *parent, ConfigStore &config,
                         ModeCatalog &modes, const std::string &modes_dir,
                         const AudioSource &audio);

} // namespace whispertrigger
