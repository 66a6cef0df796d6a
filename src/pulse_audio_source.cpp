#include "pulse_audio_source.hpp"

#include "errors.hpp"

namespace whispertrigger {

namespace {

constexpr int NUM_CHANNELS = 1;
constexpr uint32_t FRAGMENT_SAMPLES = SAMPLE_RATE / 20;  // ~50 ms

} // namespace

PulseAudioSource::PulseAudioSource() {
    mainloop_ = pa_glib_mainloop_new(g_main_context_default());
    pa_mainloop_api *api = pa_glib_mainloop_get_api(mainloop_);

    context_ = pa_context_new(api, "whispertrigger");
    pa_context_set_state_callback(context_, on_context_state, this);
    if (pa_context_connect(context_, nullptr, PA_CONTEXT_NOFLAGS, nullptr) <
        0) {
        g_warning("Cannot connect to PulseAudio: %s",
                  pa_strerror(pa_context_errno(context_)));
    }
}

PulseAudioSource::~PulseAudioSource() {
    close();
    if (context_ != nullptr) {
        pa_context_set_state_callback(context_, nullptr, nullptr);
        pa_context_disconnect(context_);
        pa_context_unref(context_);
        context_ = nullptr;
    }
    if (mainloop_ != nullptr) {
        pa_glib_mainloop_free(mainloop_);
        mainloop_ = nullptr;
    }
}

void PulseAudioSource::on_source_info(pa_context * /*c*/,
                                      const pa_source_info *info, int eol,
                                      void *userdata) {
    if (eol > 0) return;
    if (info == nullptr) return;
    // Monitors capture playback, not a microphone
    if (info->monitor_of_sink != PA_INVALID_INDEX) return;
    auto *self = static_cast<PulseAudioSource *>(userdata);
    self->sources_.emplace_back(info->name, info->description);
}

void PulseAudioSource::on_context_state(pa_context *c, void *userdata) {
    auto *self = static_cast<PulseAudioSource *>(userdata);

    switch (pa_context_get_state(c)) {
    case PA_CONTEXT_READY:
        self->ready_ = true;
        self->sources_.clear();
        pa_operation_unref(
            pa_context_get_source_info_list(c, on_source_info, self));
        g_message("PulseAudio ready");
        break;
    case PA_CONTEXT_FAILED:
    case PA_CONTEXT_TERMINATED:
        self->ready_ = false;
        g_warning("PulseAudio context failed: %s",
                  pa_strerror(pa_context_errno(c)));
        break;
    default:
        break;
    }
}

bool PulseAudioSource::open(FramesCallback on_frames,
                            FailureCallback on_failure, GError **error) {
    if (stream_ != nullptr) close();

    if (!ready_) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_DEVICE,
                            "Audio system is not ready");
        return false;
    }

    static const pa_sample_spec spec = {
        .format = PA_SAMPLE_S16LE,
        .rate = SAMPLE_RATE,
        .channels = NUM_CHANNELS,
    };

    stream_ = pa_stream_new(context_, "whispertrigger-record", &spec, nullptr);
    if (stream_ == nullptr) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_DEVICE,
                    "Failed to create stream: %s",
                    pa_strerror(pa_context_errno(context_)));
        return false;
    }

    on_frames_ = std::move(on_frames);
    on_failure_ = std::move(on_failure);
    pa_stream_set_read_callback(stream_, on_stream_read, this);
    pa_stream_set_state_callback(stream_, on_stream_state, this);

    pa_buffer_attr attr = {};
    attr.maxlength = static_cast<uint32_t>(-1);
    attr.tlength = static_cast<uint32_t>(-1);
    attr.prebuf = static_cast<uint32_t>(-1);
    attr.minreq = static_cast<uint32_t>(-1);
    attr.fragsize = FRAGMENT_SAMPLES * sizeof(int16_t);

    const char *dev = device_.empty() ? nullptr : device_.c_str();
    if (pa_stream_connect_record(stream_, dev, &attr,
                                 PA_STREAM_ADJUST_LATENCY) < 0) {
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_DEVICE,
                    "Failed to connect stream to %s: %s",
                    dev != nullptr ? dev : "the default source",
                    pa_strerror(pa_context_errno(context_)));
        pa_stream_set_read_callback(stream_, nullptr, nullptr);
        pa_stream_set_state_callback(stream_, nullptr, nullptr);
        pa_stream_unref(stream_);
        stream_ = nullptr;
        return false;
    }
    return true;
}

void PulseAudioSource::close() {
    if (stream_ == nullptr) return;

    pa_stream_set_read_callback(stream_, nullptr, nullptr);
    pa_stream_set_state_callback(stream_, nullptr, nullptr);
    pa_stream_disconnect(stream_);
    pa_stream_unref(stream_);
    stream_ = nullptr;
    on_frames_ = nullptr;
    on_failure_ = nullptr;
}

void PulseAudioSource::on_stream_read(pa_stream *s, size_t /*nbytes*/,
                                      void *userdata) {
    auto *self = static_cast<PulseAudioSource *>(userdata);

    const void *data;
    size_t length;

    while (pa_stream_peek(s, &data, &length) >= 0 && length > 0) {
        // data is null for holes in the stream
        if (data != nullptr && self->on_frames_) {
            self->on_frames_(static_cast<const int16_t *>(data),
                             length / sizeof(int16_t));
        }
        pa_stream_drop(s);
    }
}

void PulseAudioSource::on_stream_state(pa_stream *s, void *userdata) {
    auto *self = static_cast<PulseAudioSource *>(userdata);

    if (pa_stream_get_state(s) == PA_STREAM_FAILED) {
        GError *error = g_error_new(
            WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_DEVICE,
            "PulseAudio stream failed: %s",
            pa_strerror(pa_context_errno(self->context_)));
        if (self->on_failure_) self->on_failure_(error);
        g_error_free(error);
    }
}

} // namespace whispertrigger
