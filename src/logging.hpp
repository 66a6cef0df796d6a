#pragma once

#include <string>

namespace whispertrigger {

// $XDG_CACHE_HOME/whispertrigger/whispertrigger.log
std::string default_log_path();

// Installs a structured GLib log writer that appends every record to the
// log file and then chains to g_log_writer_default(). Must run before the
// first message is logged.
void install_log_writer(const std::string &path);

} // namespace whispertrigger
