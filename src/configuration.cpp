#include "configuration.hpp"

#include <glib.h>

namespace whispertrigger {

namespace {

struct ModelSizeName {
    ModelSize size;
    const char *name;
};

constexpr ModelSizeName MODEL_SIZES[] = {
    {ModelSize::Tiny, "tiny"},     {ModelSize::Base, "base"},
    {ModelSize::Small, "small"},   {ModelSize::Medium, "medium"},
    {ModelSize::Large, "large"},
};

} // namespace

const char *model_size_name(ModelSize size) {
    for (const auto &entry : MODEL_SIZES) {
        if (entry.size == size) return entry.name;
    }
    return "base";
}

bool model_size_from_name(const std::string &name, ModelSize *size) {
    for (const auto &entry : MODEL_SIZES) {
        if (name == entry.name) {
            *size = entry.size;
            return true;
        }
    }
    // Older configs stored the faster-whisper names
    if (name == "large-v2" || name == "large-v3") {
        *size = ModelSize::Large;
        return true;
    }
    return false;
}

const char *device_preference_name(DevicePreference device) {
    switch (device) {
    case DevicePreference::Auto:
        return "auto";
    case DevicePreference::Gpu:
        return "gpu";
    case DevicePreference::Cpu:
        return "cpu";
    }
    return "auto";
}

bool device_preference_from_name(const std::string &name,
                                 DevicePreference *device) {
    if (name == "auto") {
        *device = DevicePreference::Auto;
    } else if (name == "gpu" || name == "cuda") {
        *device = DevicePreference::Gpu;
    } else if (name == "cpu") {
        *device = DevicePreference::Cpu;
    } else {
        return false;
    }
    return true;
}

const char *compute_device_name(ComputeDevice device) {
    return device == ComputeDevice::Gpu ? "GPU" : "CPU";
}

const char *action_key(Action action) {
    switch (action) {
    case Action::ToggleRecording:
        return "start_stop_recording";
    case Action::TranscribeLast:
        return "transcribe_last";
    case Action::OpenSettings:
        return "settings";
    case Action::Quit:
        return "quit";
    }
    return "";
}

const char *action_label(Action action) {
    switch (action) {
    case Action::ToggleRecording:
        return "Start/Stop Recording";
    case Action::TranscribeLast:
        return "Transcribe Last Recording";
    case Action::OpenSettings:
        return "Open Settings";
    case Action::Quit:
        return "Quit";
    }
    return "";
}

ComputeDevice resolve_compute_device(DevicePreference preference,
                                     bool force_cpu,
                                     bool accelerator_available) {
    if (force_cpu || preference == DevicePreference::Cpu)
        return ComputeDevice::Cpu;

    if (!accelerator_available) {
        if (preference == DevicePreference::Gpu) {
            g_warning("GPU requested but no accelerator was found, "
                      "using CPU");
        }
        return ComputeDevice::Cpu;
    }
    return ComputeDevice::Gpu;
}

std::string default_models_dir() {
    const char *env_dir = g_getenv("WHISPERTRIGGER_MODELS_DIR");
    if (env_dir != nullptr && env_dir[0] != '\0') return env_dir;

    gchar *dir = g_build_filename(g_get_user_data_dir(), "whispertrigger",
                                  "models", nullptr);
    std::string result(dir);
    g_free(dir);
    return result;
}

} // namespace whispertrigger
