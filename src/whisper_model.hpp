#pragma once

#include "speech_model.hpp"

#include <string>

struct whisper_context;

namespace whispertrigger {

// Looks for a GPU ggml backend device. description receives its name.
bool probe_accelerator(std::string *description);

// Routes whisper.cpp and ggml log output into the GLib log.
void install_whisper_log_handler();

class WhisperModel : public SpeechModel {
public:
    WhisperModel();
    ~WhisperModel() override;

    WhisperModel(const WhisperModel &) = delete;
    WhisperModel &operator=(const WhisperModel &) = delete;

    bool load(const std::string &path, ComputeDevice device,
              GError **error) override;
    bool is_loaded() const override { return ctx_ != nullptr; }
    ComputeDevice device() const override { return device_; }
    bool switch_to_cpu(GError **error) override;
    bool transcribe(const std::vector<float> &pcm,
                    const std::string &language, Transcript *out,
                    GError **error) override;

private:
    void unload();

    whisper_context *ctx_ = nullptr;
    std::string path_;
    ComputeDevice device_ = ComputeDevice::Cpu;
    int n_threads_ = 4;
};

} // namespace whispertrigger
