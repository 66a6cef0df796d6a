#include "settings_dialog.hpp"

#include <map>
#include <string>

namespace whispertrigger {

namespace {

constexpr ModelSize MODEL_SIZES[] = {ModelSize::Tiny, ModelSize::Base,
                                     ModelSize::Small, ModelSize::Medium,
                                     ModelSize::Large};
constexpr DevicePreference DEVICES[] = {
    DevicePreference::Auto, DevicePreference::Gpu, DevicePreference::Cpu};
constexpr Action ACTIONS[] = {Action::ToggleRecording, Action::TranscribeLast,
                              Action::OpenSettings, Action::Quit};

GtkWidget *add_row(GtkGrid *grid, int row, const char *title,
                   GtkWidget *widget) {
    GtkWidget *label = gtk_label_new(title);
    gtk_label_set_xalign(GTK_LABEL(label), 0.0);
    gtk_grid_attach(grid, label, 0, row, 1, 1);
    gtk_widget_set_hexpand(widget, TRUE);
    gtk_grid_attach(grid, widget, 1, row, 1, 1);
    return widget;
}

std::string combo_id(GtkWidget *combo) {
    const gchar *id = gtk_combo_box_get_active_id(GTK_COMBO_BOX(combo));
    return id != nullptr ? id : "";
}

void show_error(GtkWidget *parent, const char *title, const char *message) {
    GtkWidget *error_dialog = gtk_message_dialog_new(
        GTK_WINDOW(parent), GTK_DIALOG_MODAL, GTK_MESSAGE_ERROR,
        GTK_BUTTONS_OK, "%s", title);
    gtk_message_dialog_format_secondary_text(GTK_MESSAGE_DIALOG(error_dialog),
                                             "%s", message);
    gtk_dialog_run(GTK_DIALOG(error_dialog));
    gtk_widget_destroy(error_dialog);
}

constexpr ModeKind MODE_KINDS[] = {ModeKind::Rewrite, ModeKind::Cleaned,
                                   ModeKind::Verbatim};

// Widgets of the Modes tab. Lives on the stack of run_settings_dialog.
struct ModeEditor {
    ModeCatalog *modes = nullptr;
    std::string dir;
    GtkWidget *dialog = nullptr;
    GtkWidget *active_combo = nullptr;
    GtkWidget *select_combo = nullptr;
    GtkWidget *name_entry = nullptr;
    GtkWidget *description_entry = nullptr;
    GtkWidget *kind_combo = nullptr;
    GtkTextBuffer *instructions = nullptr;
    // Name of the mode loaded into the fields; empty for an unsaved one
    std::string editing;
};

void fill_mode_combo(GtkWidget *combo, const ModeCatalog &modes,
                     const std::string &selected) {
    gtk_combo_box_text_remove_all(GTK_COMBO_BOX_TEXT(combo));
    for (const auto &name : modes.names()) {
        gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(combo), name.c_str(),
                                  name.c_str());
    }
    if (!gtk_combo_box_set_active_id(GTK_COMBO_BOX(combo), selected.c_str())) {
        gtk_combo_box_set_active_id(GTK_COMBO_BOX(combo),
                                    ModeCatalog::DEFAULT_MODE);
    }
}

void show_mode(ModeEditor *editor, const ProcessingMode &mode) {
    gtk_entry_set_text(GTK_ENTRY(editor->name_entry), mode.name.c_str());
    gtk_entry_set_text(GTK_ENTRY(editor->description_entry),
                       mode.description.c_str());
    gtk_combo_box_set_active_id(GTK_COMBO_BOX(editor->kind_combo),
                                mode_kind_name(mode.kind));
    gtk_text_buffer_set_text(editor->instructions, mode.instructions.c_str(),
                             -1);
}

void refresh_modes(ModeEditor *editor, const std::string &editing,
                   const std::string &active) {
    fill_mode_combo(editor->active_combo, *editor->modes, active);
    fill_mode_combo(editor->select_combo, *editor->modes, editing);
}

void on_mode_selected(GtkComboBox *combo, gpointer user_data) {
    auto *editor = static_cast<ModeEditor *>(user_data);
    const std::string name = combo_id(GTK_WIDGET(combo));
    if (name.empty()) return;
    editor->editing = name;
    show_mode(editor, editor->modes->find(name));
}

void on_new_mode(GtkButton *, gpointer user_data) {
    auto *editor = static_cast<ModeEditor *>(user_data);

    std::string name = "new_mode";
    for (int counter = 1; editor->modes->contains(name); counter++)
        name = "new_mode_" + std::to_string(counter);

    ProcessingMode mode = editor->modes->find(ModeCatalog::DEFAULT_MODE);
    mode.name = name;
    mode.description = "New processing mode";
    mode.kind = ModeKind::Rewrite;

    gtk_combo_box_set_active(GTK_COMBO_BOX(editor->select_combo), -1);
    editor->editing.clear();
    show_mode(editor, mode);
}

void on_save_mode(GtkButton *, gpointer user_data) {
    auto *editor = static_cast<ModeEditor *>(user_data);

    ProcessingMode mode;
    mode.name = gtk_entry_get_text(GTK_ENTRY(editor->name_entry));
    mode.description = gtk_entry_get_text(GTK_ENTRY(editor->description_entry));
    mode_kind_from_name(combo_id(editor->kind_combo), &mode.kind);
    GtkTextIter start, end;
    gtk_text_buffer_get_bounds(editor->instructions, &start, &end);
    gchar *instructions =
        gtk_text_buffer_get_text(editor->instructions, &start, &end, FALSE);
    mode.instructions = instructions;
    g_free(instructions);

    GError *error = nullptr;
    if (!editor->modes->save_mode(editor->dir, mode, &error)) {
        g_warning("Mode not saved: %s", error->message);
        show_error(editor->dialog, "Mode not saved", error->message);
        g_error_free(error);
        return;
    }

    std::string active = combo_id(editor->active_combo);
    const std::string renamed_from = editor->editing;
    if (!renamed_from.empty() && renamed_from != mode.name &&
        !editor->modes->is_builtin(renamed_from)) {
        if (!editor->modes->remove_mode(editor->dir, renamed_from, &error)) {
            g_warning("Cannot remove renamed mode %s: %s",
                      renamed_from.c_str(), error->message);
            g_clear_error(&error);
        } else if (active == renamed_from) {
            active = mode.name;
        }
    }
    refresh_modes(editor, mode.name, active);
}

void on_delete_mode(GtkButton *, gpointer user_data) {
    auto *editor = static_cast<ModeEditor *>(user_data);
    if (editor->editing.empty()) return;

    GError *error = nullptr;
    if (!editor->modes->remove_mode(editor->dir, editor->editing, &error)) {
        show_error(editor->dialog, "Mode not deleted", error->message);
        g_error_free(error);
        return;
    }

    const std::string next = editor->modes->contains(editor->editing)
                                 ? editor->editing
                                 : ModeCatalog::DEFAULT_MODE;
    refresh_modes(editor, next, combo_id(editor->active_combo));
}

GtkWidget *build_modes_page(ModeEditor *editor,
                            const std::string &current_mode) {
    GtkWidget *grid = gtk_grid_new();
    gtk_container_set_border_width(GTK_CONTAINER(grid), 12);
    gtk_grid_set_row_spacing(GTK_GRID(grid), 8);
    gtk_grid_set_column_spacing(GTK_GRID(grid), 12);
    int row = 0;

    editor->select_combo = add_row(GTK_GRID(grid), row++, "Edit mode:",
                                   gtk_combo_box_text_new());
    editor->name_entry = add_row(GTK_GRID(grid), row++, "Name:",
                                 gtk_entry_new());
    editor->description_entry = add_row(GTK_GRID(grid), row++,
                                        "Description:", gtk_entry_new());
    editor->kind_combo = add_row(GTK_GRID(grid), row++, "Processing:",
                                 gtk_combo_box_text_new());
    for (ModeKind kind : MODE_KINDS) {
        gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(editor->kind_combo),
                                  mode_kind_name(kind), mode_kind_name(kind));
    }

    GtkWidget *view = gtk_text_view_new();
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(view), GTK_WRAP_WORD_CHAR);
    editor->instructions = gtk_text_view_get_buffer(GTK_TEXT_VIEW(view));
    GtkWidget *scroll = gtk_scrolled_window_new(nullptr, nullptr);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_size_request(scroll, -1, 140);
    gtk_widget_set_vexpand(scroll, TRUE);
    gtk_container_add(GTK_CONTAINER(scroll), view);
    add_row(GTK_GRID(grid), row++, "Instructions:", scroll);

    GtkWidget *buttons = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    GtkWidget *new_btn = gtk_button_new_with_label("New Mode");
    GtkWidget *save_btn = gtk_button_new_with_label("Save Mode");
    GtkWidget *delete_btn = gtk_button_new_with_label("Delete Mode");
    g_signal_connect(new_btn, "clicked", G_CALLBACK(on_new_mode), editor);
    g_signal_connect(save_btn, "clicked", G_CALLBACK(on_save_mode), editor);
    g_signal_connect(delete_btn, "clicked", G_CALLBACK(on_delete_mode),
                     editor);
    gtk_box_pack_start(GTK_BOX(buttons), new_btn, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(buttons), save_btn, FALSE, FALSE, 0);
    gtk_box_pack_end(GTK_BOX(buttons), delete_btn, FALSE, FALSE, 0);
    gtk_grid_attach(GTK_GRID(grid), buttons, 1, row++, 1, 1);

    g_signal_connect(editor->select_combo, "changed",
                     G_CALLBACK(on_mode_selected), editor);
    fill_mode_combo(editor->select_combo, *editor->modes, current_mode);
    return grid;
}

} // namespace

bool run_settings_dialog(GtkWindow *parent, ConfigStore &config,
                         ModeCatalog &modes, const std::string &modes_dir,
                         const AudioSource &audio) {
    const Configuration &current = config.current();

    GtkWidget *dialog = gtk_dialog_new_with_buttons(
        "WhisperTrigger Settings", parent,
        static_cast<GtkDialogFlags>(GTK_DIALOG_MODAL |
                                    GTK_DIALOG_DESTROY_WITH_PARENT),
        "Cancel", GTK_RESPONSE_CANCEL,
        "Save", GTK_RESPONSE_ACCEPT,
        nullptr);
    gtk_window_set_default_size(GTK_WINDOW(dialog), 420, -1);

    GtkWidget *content = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
    gtk_container_set_border_width(GTK_CONTAINER(content), 12);

    GtkWidget *notebook = gtk_notebook_new();
    gtk_box_pack_start(GTK_BOX(content), notebook, TRUE, TRUE, 0);

    GtkWidget *grid = gtk_grid_new();
    gtk_container_set_border_width(GTK_CONTAINER(grid), 12);
    gtk_grid_set_row_spacing(GTK_GRID(grid), 8);
    gtk_grid_set_column_spacing(GTK_GRID(grid), 12);
    gtk_notebook_append_page(GTK_NOTEBOOK(notebook), grid,
                             gtk_label_new("General"));
    int row = 0;

    // Transcription
    GtkWidget *model_combo = add_row(GTK_GRID(grid), row++, "Model size:",
                                     gtk_combo_box_text_new());
    for (ModelSize size : MODEL_SIZES) {
        gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(model_combo),
                                  model_size_name(size),
                                  model_size_name(size));
    }
    gtk_combo_box_set_active_id(GTK_COMBO_BOX(model_combo),
                                model_size_name(current.model_size));

    GtkWidget *device_combo = add_row(GTK_GRID(grid), row++,
                                      "Compute device:",
                                      gtk_combo_box_text_new());
    for (DevicePreference device : DEVICES) {
        gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(device_combo),
                                  device_preference_name(device),
                                  device_preference_name(device));
    }
    gtk_combo_box_set_active_id(GTK_COMBO_BOX(device_combo),
                                device_preference_name(current.device));

    GtkWidget *language_entry = add_row(GTK_GRID(grid), row++, "Language:",
                                        gtk_entry_new());
    gtk_entry_set_placeholder_text(GTK_ENTRY(language_entry),
                                   "en, de, fr... or auto");
    gtk_entry_set_text(GTK_ENTRY(language_entry), current.language.c_str());

    // Post-processing
    GtkWidget *mode_combo = add_row(GTK_GRID(grid), row++, "Processing mode:",
                                    gtk_combo_box_text_new());
    fill_mode_combo(mode_combo, modes, current.processing_mode);

    GtkWidget *instructions_view = gtk_text_view_new();
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(instructions_view),
                                GTK_WRAP_WORD_CHAR);
    GtkTextBuffer *instructions_buffer =
        gtk_text_view_get_buffer(GTK_TEXT_VIEW(instructions_view));
    gtk_text_buffer_set_text(instructions_buffer,
                             current.instruction_text.c_str(), -1);
    GtkWidget *instructions_scroll = gtk_scrolled_window_new(nullptr, nullptr);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(instructions_scroll),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_size_request(instructions_scroll, -1, 80);
    gtk_container_add(GTK_CONTAINER(instructions_scroll), instructions_view);
    add_row(GTK_GRID(grid), row++, "Instructions:", instructions_scroll);

    // Output and input
    GtkWidget *inject_check = gtk_check_button_new_with_label(
        "Type the text into the focused window");
    gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(inject_check),
                                 current.inject_text);
    gtk_grid_attach(GTK_GRID(grid), inject_check, 1, row++, 1, 1);

    GtkWidget *audio_combo = add_row(GTK_GRID(grid), row++, "Audio device:",
                                     gtk_combo_box_text_new());
    gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(audio_combo), "", "Default");
    for (const auto &src : audio.list_sources()) {
        gtk_combo_box_text_append(GTK_COMBO_BOX_TEXT(audio_combo),
                                  src.first.c_str(), src.second.c_str());
    }
    if (!gtk_combo_box_set_active_id(GTK_COMBO_BOX(audio_combo),
                                     current.audio_device.c_str())) {
        gtk_combo_box_set_active(GTK_COMBO_BOX(audio_combo), 0);
    }

    // Shortcuts
    std::map<Action, GtkWidget *> shortcut_entries;
    for (Action action : ACTIONS) {
        std::string title = std::string(action_label(action)) + ":";
        GtkWidget *entry = add_row(GTK_GRID(grid), row++, title.c_str(),
                                   gtk_entry_new());
        gtk_entry_set_placeholder_text(GTK_ENTRY(entry), "<Ctrl><Shift>space");
        auto it = current.shortcuts.find(action);
        if (it != current.shortcuts.end())
            gtk_entry_set_text(GTK_ENTRY(entry), it->second.c_str());
        shortcut_entries[action] = entry;
    }

    ModeEditor editor;
    editor.modes = &modes;
    editor.dir = modes_dir;
    editor.dialog = dialog;
    editor.active_combo = mode_combo;
    gtk_notebook_append_page(GTK_NOTEBOOK(notebook),
                             build_modes_page(&editor, current.processing_mode),
                             gtk_label_new("Modes"));

    gtk_widget_show_all(content);

    bool saved = false;
    while (gtk_dialog_run(GTK_DIALOG(dialog)) == GTK_RESPONSE_ACCEPT) {
        Configuration candidate = config.current();

        model_size_from_name(combo_id(model_combo), &candidate.model_size);
        device_preference_from_name(combo_id(device_combo), &candidate.device);
        candidate.language = gtk_entry_get_text(GTK_ENTRY(language_entry));
        const std::string mode = combo_id(mode_combo);
        if (!mode.empty()) candidate.processing_mode = mode;

        GtkTextIter start, end;
        gtk_text_buffer_get_bounds(instructions_buffer, &start, &end);
        gchar *instructions =
            gtk_text_buffer_get_text(instructions_buffer, &start, &end, FALSE);
        candidate.instruction_text = instructions;
        g_free(instructions);

        candidate.inject_text =
            gtk_toggle_button_get_active(GTK_TOGGLE_BUTTON(inject_check));
        candidate.audio_device = combo_id(audio_combo);

        for (const auto &entry : shortcut_entries) {
            candidate.shortcuts[entry.first] =
                gtk_entry_get_text(GTK_ENTRY(entry.second));
        }

        GError *error = nullptr;
        if (config.commit(candidate, &error)) {
            saved = true;
            break;
        }
        g_warning("Settings rejected: %s", error->message);
        show_error(dialog, "Settings not saved", error->message);
        g_error_free(error);
    }

    gtk_widget_destroy(dialog);
    return saved;
}

} // namespace whispertrigger
