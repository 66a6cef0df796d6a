#pragma once

#include <map>
#include <string>

namespace whispertrigger {

enum class ModelSize { Tiny, Base, Small, Medium, Large };
enum class DevicePreference { Auto, Gpu, Cpu };
enum class ComputeDevice { Cpu, Gpu };

// Logical actions reachable from global hotkeys and the tray menu.
enum class Action { ToggleRecording, TranscribeLast, OpenSettings, Quit };

struct RewriteSettings {
    std::string endpoint = "https://api.mistral.ai/v1/chat/completions";
    std::string model = "mistral-small-latest";
    std::string api_key;  // empty = MISTRAL_API_KEY from the environment
    int timeout_s = 30;
};

struct Configuration {
    ModelSize model_size = ModelSize::Base;
    std::string language = "en";  // "auto" lets the model detect it
    std::map<Action, std::string> shortcuts = {
        {Action::ToggleRecording, "<Ctrl><Shift>space"},
        {Action::TranscribeLast, "<Alt>t"},
        {Action::OpenSettings, "<Alt>c"},
        {Action::Quit, "<Alt>q"},
    };
    std::string processing_mode = "default";
    std::string instruction_text;  // overrides the mode instructions when set
    DevicePreference device = DevicePreference::Auto;
    bool inject_text = true;
    std::string audio_device;  // PulseAudio source name, empty = default

    int min_duration_ms = 250;
    int max_duration_s = 300;
    int silence_threshold = 500;      // RMS on the int16 scale
    double silence_duration_s = 0.0;  // 0 disables silence auto-stop

    std::string models_dir;
    RewriteSettings rewrite;
};

const char *model_size_name(ModelSize size);
bool model_size_from_name(const std::string &name, ModelSize *size);

const char *device_preference_name(DevicePreference device);
bool device_preference_from_name(const std::string &name,
                                 DevicePreference *device);

const char *compute_device_name(ComputeDevice device);

// Key used for the action inside the "hotkeys" config object.
const char *action_key(Action action);
const char *action_label(Action action);

// Picks the inference device. A GPU preference without an accelerator
// degrades to CPU; force_cpu wins over everything.
ComputeDevice resolve_compute_device(DevicePreference preference,
                                     bool force_cpu,
                                     bool accelerator_available);

std::string default_models_dir();

} // namespace whispertrigger
