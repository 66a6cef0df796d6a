#pragma once

#include "configuration.hpp"

#include <glib.h>

#include <string>
#include <vector>

namespace whispertrigger {

struct Transcript {
    std::string text;
    std::string language;
};

// Opaque speech-to-text model. Not reentrant: TranscriptionService calls it
// from its single worker thread only.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    // Fails with WHISPERTRIGGER_ERROR_ACCELERATOR when only the GPU part
    // failed, WHISPERTRIGGER_ERROR_MODEL otherwise.
    virtual bool load(const std::string &path, ComputeDevice device,
                      GError **error) = 0;
    virtual bool is_loaded() const = 0;
    virtual ComputeDevice device() const = 0;

    // Reloads the current model on the CPU.
    virtual bool switch_to_cpu(GError **error) = 0;

    virtual bool transcribe(const std::vector<float> &pcm,
                            const std::string &language, Transcript *out,
                            GError **error) = 0;
};

} // namespace whispertrigger
