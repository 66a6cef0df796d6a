#pragma once

#include "audio_source.hpp"

#include <pulse/glib-mainloop.h>
#include <pulse/pulseaudio.h>

namespace whispertrigger {

// PulseAudio (or PipeWire's pulse server) record stream driven by the GLib
// main loop.
class PulseAudioSource : public AudioSource {
public:
    PulseAudioSource();
    ~PulseAudioSource() override;

    PulseAudioSource(const PulseAudioSource &) = delete;
    PulseAudioSource &operator=(const PulseAudioSource &) = delete;

    bool open(FramesCallback on_frames, FailureCallback on_failure,
              GError **error) override;
    void close() override;
    bool is_open() const override { return stream_ != nullptr; }

    std::vector<std::pair<std::string, std::string>>
    list_sources() const override {
        return sources_;
    }
    void set_device(const std::string &name) override { device_ = name; }

private:
    static void on_context_state(pa_context *c, void *userdata);
    static void on_source_info(pa_context *c, const pa_source_info *info,
                               int eol, void *userdata);
    static void on_stream_read(pa_stream *s, size_t nbytes, void *userdata);
    static void on_stream_state(pa_stream *s, void *userdata);

    pa_glib_mainloop *mainloop_ = nullptr;
    pa_context *context_ = nullptr;
    pa_stream *stream_ = nullptr;
    bool ready_ = false;

    std::string device_;
    std::vector<std::pair<std::string, std::string>> sources_;

    FramesCallback on_frames_;
    FailureCallback on_failure_;
};

} // namespace whispertrigger
