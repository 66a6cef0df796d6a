#include "application.hpp"

#include "settings_dialog.hpp"

namespace whispertrigger {

namespace {

constexpr const char *APP_ID = "io.github.whispertrigger";
constexpr const char *IDLE_ICON = "audio-input-microphone";
constexpr const char *RECORDING_ICON = "media-record";

} // namespace

Application::Application() {
    app_ = gtk_application_new(APP_ID, G_APPLICATION_DEFAULT_FLAGS);

    const GOptionEntry entries[] = {
        {"cpu", 0, G_OPTION_FLAG_NONE, G_OPTION_ARG_NONE, &force_cpu_,
         "Force CPU inference even when a GPU is available", nullptr},
        {"config", 0, G_OPTION_FLAG_NONE, G_OPTION_ARG_FILENAME,
         &config_path_, "Read and write the configuration in FILE", "FILE"},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr},
    };
    g_application_add_main_option_entries(G_APPLICATION(app_), entries);

    g_signal_connect(app_, "activate", G_CALLBACK(on_activate), this);
    g_signal_connect(app_, "shutdown", G_CALLBACK(on_shutdown), this);
}

Application::~Application() {
    shutdown();
    g_object_unref(app_);
    g_free(config_path_);
}

int Application::run(int argc, char **argv) {
    return g_application_run(G_APPLICATION(app_), argc, argv);
}

void Application::on_activate(GApplication * /*app*/, gpointer user_data) {
    static_cast<Application *>(user_data)->activate();
}

void Application::on_shutdown(GApplication * /*app*/, gpointer user_data) {
    static_cast<Application *>(user_data)->shutdown();
}

// --- Startup ---

void Application::load_configuration() {
    const std::string path = config_path_ != nullptr
                                 ? std::string(config_path_)
                                 : ConfigStore::default_path();
    config_ = std::make_unique<ConfigStore>(path);

    GError *error = nullptr;
    if (!config_->load(&error)) {
        g_warning("Using default settings: %s", error->message);
        notify(NoticeLevel::Warning, "Configuration not loaded",
               std::string(error->message) + "; using defaults");
        g_error_free(error);
    }

    gchar *config_dir = g_path_get_dirname(path.c_str());
    gchar *modes_dir = g_build_filename(config_dir, "modes", nullptr);
    modes_dir_ = modes_dir;
    modes_.load_directory(modes_dir_);
    g_free(modes_dir);
    g_free(config_dir);
}

void Application::activate() {
    // A second launch only re-activates the running instance
    if (activated_) return;
    activated_ = true;

    // No main window; keep running from the tray
    g_application_hold(G_APPLICATION(app_));

    load_configuration();

    install_whisper_log_handler();
    std::string gpu;
    const bool accelerator = !force_cpu_ && probe_accelerator(&gpu);
    if (accelerator) {
        g_message("Accelerator found: %s", gpu.c_str());
    } else {
        g_message("No accelerator in use, inference runs on the CPU");
    }

    audio_ = std::make_unique<PulseAudioSource>();
    model_ = std::make_unique<WhisperModel>();
    generator_ = std::make_unique<SoupTextGenerator>(*config_);
    injector_ = std::make_unique<XdoInjector>();
    TextInjector *injector =
        injector_->tool() != TypingTool::NONE ? injector_.get() : nullptr;

    pipeline_ = std::make_unique<DictationPipeline>(
        *config_, *audio_, *model_, modes_, generator_.get(), clipboard_,
        injector, *this);
    indicator_window_ = std::make_unique<RecordingIndicator>();

    pipeline_->set_state_handler(
        [this](RecordingState state) { on_state_changed(state); });
    pipeline_->set_level_handler(
        [this](double level) { indicator_window_->set_level(level); });
    pipeline_->set_delivered_handler([this](const std::string & /*text*/) {
        gtk_widget_set_sensitive(copy_item_, TRUE);
    });

    build_tray();

    hotkeys_ = std::make_unique<HotkeyListener>(
        [this](Action action) { dispatch(action); });
    hotkeys_->bind(config_->current().shortcuts);
    config_->subscribe(
        [this](const Configuration &previous, const Configuration &current) {
            if (hotkeys_ && previous.shortcuts != current.shortcuts) {
                g_message("Shortcuts changed, rebinding");
                hotkeys_->bind(current.shortcuts);
            }
        });

    pipeline_->start(force_cpu_, accelerator);

    const std::string &toggle =
        config_->current().shortcuts.at(Action::ToggleRecording);
    if (hotkeys_->available() && !toggle.empty()) {
        notify(NoticeLevel::Info, "WhisperTrigger",
               "WhisperTrigger is running. Press " + toggle +
                   " to start recording.");
    } else {
        notify(NoticeLevel::Info, "WhisperTrigger",
               "WhisperTrigger is running. Use the tray menu to record.");
    }
}

void Application::shutdown() {
    // The pipeline joins the transcription worker; it goes before the
    // components it references.
    hotkeys_.reset();
    pipeline_.reset();
    indicator_window_.reset();
    generator_.reset();
    injector_.reset();
    model_.reset();
    audio_.reset();

    if (tray_ != nullptr) {
        g_object_unref(tray_);
        tray_ = nullptr;
    }
}

// --- Tray menu ---

void Application::build_tray() {
    GtkWidget *menu = gtk_menu_new();

    record_item_ = gtk_menu_item_new_with_label("Start Recording");
    g_signal_connect(record_item_, "activate", G_CALLBACK(on_menu_record),
                     this);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), record_item_);

    GtkWidget *transcribe_item =
        gtk_menu_item_new_with_label("Transcribe Last Recording");
    g_signal_connect(transcribe_item, "activate",
                     G_CALLBACK(on_menu_transcribe_last), this);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), transcribe_item);

    copy_item_ = gtk_menu_item_new_with_label("Copy Last Transcription");
    g_signal_connect(copy_item_, "activate", G_CALLBACK(on_menu_copy), this);
    gtk_widget_set_sensitive(copy_item_, FALSE);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), copy_item_);

    gtk_menu_shell_append(GTK_MENU_SHELL(menu),
                          gtk_separator_menu_item_new());

    GtkWidget *settings_item = gtk_menu_item_new_with_label("Settings");
    g_signal_connect(settings_item, "activate",
                     G_CALLBACK(on_menu_settings), this);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), settings_item);

    GtkWidget *quit_item = gtk_menu_item_new_with_label("Quit");
    g_signal_connect(quit_item, "activate", G_CALLBACK(on_menu_quit), this);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), quit_item);

    gtk_widget_show_all(menu);

    G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    tray_ = app_indicator_new("whispertrigger", IDLE_ICON,
                              APP_INDICATOR_CATEGORY_APPLICATION_STATUS);
    G_GNUC_END_IGNORE_DEPRECATIONS
    app_indicator_set_status(tray_, APP_INDICATOR_STATUS_ACTIVE);
    app_indicator_set_title(tray_, "WhisperTrigger");
    app_indicator_set_menu(tray_, GTK_MENU(menu));
}

void Application::on_menu_record(GtkMenuItem * /*item*/, gpointer user_data) {
    static_cast<Application *>(user_data)->dispatch(Action::ToggleRecording);
}

void Application::on_menu_transcribe_last(GtkMenuItem * /*item*/,
                                          gpointer user_data) {
    static_cast<Application *>(user_data)->dispatch(Action::TranscribeLast);
}

void Application::on_menu_copy(GtkMenuItem * /*item*/, gpointer user_data) {
    auto *self = static_cast<Application *>(user_data);
    if (self->pipeline_->copy_last_transcription()) {
        self->notify(NoticeLevel::Info, "WhisperTrigger",
                     "Last transcription copied to the clipboard");
    }
}

void Application::on_menu_settings(GtkMenuItem * /*item*/,
                                   gpointer user_data) {
    static_cast<Application *>(user_data)->dispatch(Action::OpenSettings);
}

void Application::on_menu_quit(GtkMenuItem * /*item*/, gpointer user_data) {
    static_cast<Application *>(user_data)->dispatch(Action::Quit);
}

// --- Actions ---

void Application::dispatch(Action action) {
    if (!pipeline_) return;

    switch (action) {
    case Action::ToggleRecording:
        pipeline_->handle(RecordingEvent::Toggle);
        break;
    case Action::TranscribeLast:
        pipeline_->transcribe_last();
        break;
    case Action::OpenSettings:
        open_settings();
        break;
    case Action::Quit:
        g_message("Quitting");
        g_application_quit(G_APPLICATION(app_));
        break;
    }
}

void Application::open_settings() {
    // The dialog runs a nested loop; a second hotkey press must not stack
    // another one on top.
    if (settings_open_) return;
    settings_open_ = true;
    if (run_settings_dialog(nullptr, *config_, modes_, modes_dir_,
                            *audio_)) {
        notify(NoticeLevel::Info, "WhisperTrigger", "Settings saved");
    }
    settings_open_ = false;
}

void Application::on_state_changed(RecordingState state) {
    switch (state) {
    case RecordingState::Recording:
        gtk_menu_item_set_label(GTK_MENU_ITEM(record_item_), "Stop Recording");
        app_indicator_set_icon_full(tray_, RECORDING_ICON, "Recording");
        indicator_window_->show("Recording...");
        break;
    case RecordingState::Finalizing:
        indicator_window_->hide();
        break;
    case RecordingState::Idle:
        gtk_menu_item_set_label(GTK_MENU_ITEM(record_item_),
                                "Start Recording");
        app_indicator_set_icon_full(tray_, IDLE_ICON, "WhisperTrigger");
        indicator_window_->hide();
        break;
    }
}

// --- Notifications ---

void Application::notify(NoticeLevel level, const std::string &title,
                         const std::string &body) {
    GNotification *notification = g_notification_new(title.c_str());
    g_notification_set_body(notification, body.c_str());

    const char *id = nullptr;
    switch (level) {
    case NoticeLevel::Info:
        // Progress messages replace each other
        id = "status";
        break;
    case NoticeLevel::Warning:
        g_notification_set_priority(notification,
                                    G_NOTIFICATION_PRIORITY_NORMAL);
        break;
    case NoticeLevel::Error:
        g_notification_set_priority(notification,
                                    G_NOTIFICATION_PRIORITY_HIGH);
        break;
    }

    g_application_send_notification(G_APPLICATION(app_), id, notification);
    g_object_unref(notification);
}

} // namespace whispertrigger
