#pragma once

#include "config_store.hpp"
#include "dictation_pipeline.hpp"
#include "gtk_clipboard_target.hpp"
#include "hotkey_listener.hpp"
#include "processing_modes.hpp"
#include "pulse_audio_source.hpp"
#include "recording_indicator.hpp"
#include "soup_text_generator.hpp"
#include "whisper_model.hpp"
#include "xdo_injector.hpp"

#include <gtk/gtk.h>
#include <libayatana-appindicator/app-indicator.h>

#include <memory>
#include <string>

namespace whispertrigger {

// Tray application: owns every component and routes hotkeys and menu items
// to the dictation pipeline.
class Application : public Notifier {
public:
    Application();
    ~Application() override;

    Application(const Application &) = delete;
    Application &operator=(const Application &) = delete;

    int run(int argc, char **argv);

    void notify(NoticeLevel level, const std::string &title,
                const std::string &body) override;

private:
    static void on_activate(GApplication *app, gpointer user_data);
    static void on_shutdown(GApplication *app, gpointer user_data);
    static void on_menu_record(GtkMenuItem *item, gpointer user_data);
    static void on_menu_transcribe_last(GtkMenuItem *item, gpointer user_data);
    static void on_menu_copy(GtkMenuItem *item, gpointer user_data);
    static void on_menu_settings(GtkMenuItem *item, gpointer user_data);
    static void on_menu_quit(GtkMenuItem *item, gpointer user_data);

    void activate();
    void shutdown();
    void load_configuration();
    void build_tray();
    void dispatch(Action action);
    void open_settings();
    void on_state_changed(RecordingState state);

    GtkApplication *app_ = nullptr;
    gboolean force_cpu_ = FALSE;
    gchar *config_path_ = nullptr;
    bool activated_ = false;
    bool settings_open_ = false;

    std::unique_ptr<ConfigStore> config_;
    ModeCatalog modes_;
    std::string modes_dir_;
    std::unique_ptr<PulseAudioSource> audio_;
    std::unique_ptr<WhisperModel> model_;
    std::unique_ptr<SoupTextGenerator> generator_;
    GtkClipboardTarget clipboard_;
    std::unique_ptr<XdoInjector> injector_;
    std::unique_ptr<DictationPipeline> pipeline_;
    std::unique_ptr<HotkeyListener> hotkeys_;
    std::unique_ptr<RecordingIndicator> indicator_window_;

    AppIndicator *tray_ = nullptr;
    GtkWidget *record_item_ = nullptr;
    GtkWidget *copy_item_ = nullptr;
};

} // namespace whispertrigger
