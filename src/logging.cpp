#include "logging.hpp"

#include <glib.h>
#include <glib/gstdio.h>

#include <cstdio>

namespace whispertrigger {

namespace {

struct LogFile {
    GMutex lock;
    FILE *file = nullptr;
};

LogFile log_file;

const char *level_name(GLogLevelFlags log_level) {
    switch (log_level & G_LOG_LEVEL_MASK) {
    case G_LOG_LEVEL_ERROR:
        return "ERROR";
    case G_LOG_LEVEL_CRITICAL:
        return "CRITICAL";
    case G_LOG_LEVEL_WARNING:
        return "WARNING";
    case G_LOG_LEVEL_MESSAGE:
        return "MESSAGE";
    case G_LOG_LEVEL_INFO:
        return "INFO";
    default:
        return "DEBUG";
    }
}

GLogWriterOutput write_log(GLogLevelFlags log_level, const GLogField *fields,
                           gsize n_fields, gpointer user_data) {
    const char *domain = nullptr;
    const char *message = nullptr;
    for (gsize i = 0; i < n_fields; i++) {
        if (g_strcmp0(fields[i].key, "GLIB_DOMAIN") == 0)
            domain = static_cast<const char *>(fields[i].value);
        else if (g_strcmp0(fields[i].key, "MESSAGE") == 0)
            message = static_cast<const char *>(fields[i].value);
    }

    auto *log = static_cast<LogFile *>(user_data);
    if (message != nullptr && log->file != nullptr &&
        !g_log_writer_default_would_drop(log_level, domain)) {
        GDateTime *now = g_date_time_new_now_local();
        gchar *stamp = g_date_time_format(now, "%Y-%m-%d %H:%M:%S");

        g_mutex_lock(&log->lock);
        fprintf(log->file, "%s.%03d %s %s: %s\n", stamp,
                g_date_time_get_microsecond(now) / 1000,
                domain != nullptr ? domain : "-", level_name(log_level),
                message);
        fflush(log->file);
        g_mutex_unlock(&log->lock);

        g_free(stamp);
        g_date_time_unref(now);
    }

    return g_log_writer_default(log_level, fields, n_fields, nullptr);
}

} // namespace

std::string default_log_path() {
    gchar *path = g_build_filename(g_get_user_cache_dir(), "whispertrigger",
                                   "whispertrigger.log", nullptr);
    std::string result(path);
    g_free(path);
    return result;
}

void install_log_writer(const std::string &path) {
    g_mutex_init(&log_file.lock);

    gchar *dir = g_path_get_dirname(path.c_str());
    if (g_mkdir_with_parents(dir, 0700) == 0) {
        log_file.file = g_fopen(path.c_str(), "a");
    }
    g_free(dir);

    // Still chain to stderr when the file cannot be opened
    g_log_set_writer_func(write_log, &log_file, nullptr);

    if (log_file.file == nullptr) {
        g_warning("Cannot open log file %s", path.c_str());
    }
}

} // namespace whispertrigger
