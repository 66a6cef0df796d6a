#pragma once

#include <glib.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace whispertrigger {

// Capture format shared by every source and expected by the model.
constexpr int SAMPLE_RATE = 16000;

// A microphone stream delivering 16 kHz mono S16 blocks on the main loop.
class AudioSource {
public:
    using FramesCallback =
        std::function<void(const int16_t *samples, size_t count)>;
    using FailureCallback = std::function<void(const GError *error)>;

    virtual ~AudioSource() = default;

    // Starts capturing. Returns false with WHISPERTRIGGER_ERROR_DEVICE when
    // the device cannot be opened; on_failure reports a stream that dies
    // later.
    virtual bool open(FramesCallback on_frames, FailureCallback on_failure,
                      GError **error) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // (name, description) pairs for the settings dialog.
    virtual std::vector<std::pair<std::string, std::string>>
    list_sources() const {
        return {};
    }
    virtual void set_device(const std::string & /*name*/) {}
};

} // namespace whispertrigger
