#pragma once

#include "audio_source.hpp"
#include "config_store.hpp"
#include "transcription.hpp"

#include <glib.h>

#include <functional>
#include <memory>
#include <vector>

namespace whispertrigger {

enum class RecordingState { Idle, Recording, Finalizing };

enum class RecordingEvent {
    Toggle,  // start when idle, stop when recording
    Start,   // ignored while recording
    Stop,
    MaxDurationReached,
    SilenceDetected,
    DeviceFailed,
};

struct RecordingSession {
    gint64 start_time = 0;  // g_get_monotonic_time()
    std::vector<int16_t> samples;
    RecordingState status = RecordingState::Recording;
};

const char *recording_state_name(RecordingState state);

// Idle -> Recording -> Finalizing -> Idle. Owns the single open session and
// hands finalized audio off as a TranscriptionRequest.
class RecordingController {
public:
    using FinalizedHandler =
        std::function<void(std::unique_ptr<TranscriptionRequest> request)>;
    using StateHandler = std::function<void(RecordingState state)>;
    using LevelHandler = std::function<void(double level)>;
    using ErrorHandler = std::function<void(const GError *error)>;

    RecordingController(AudioSource &audio, const ConfigStore &config);
    ~RecordingController();

    RecordingController(const RecordingController &) = delete;
    RecordingController &operator=(const RecordingController &) = delete;

    void set_finalized_handler(FinalizedHandler handler);
    void set_state_handler(StateHandler handler);
    void set_level_handler(LevelHandler handler);
    void set_error_handler(ErrorHandler handler);

    void handle(RecordingEvent event);

    RecordingState state() const { return state_; }
    bool has_session() const { return session_ != nullptr; }
    double captured_seconds() const;

private:
    void begin();
    void finalize(const char *reason);
    void set_state(RecordingState state);
    void on_frames(const int16_t *samples, size_t count);
    void on_device_failure(const GError *error);

    // Bound-triggered transitions run from an idle callback, never inside
    // the capture callback that noticed them.
    void post(RecordingEvent event);
    static gboolean dispatch_posted(gpointer userdata);

    AudioSource &audio_;
    const ConfigStore &config_;

    std::unique_ptr<RecordingSession> session_;
    RecordingState state_ = RecordingState::Idle;

    double level_ = 0.0;
    bool heard_speech_ = false;
    size_t silent_samples_ = 0;

    guint posted_source_ = 0;
    RecordingEvent posted_event_ = RecordingEvent::Stop;

    FinalizedHandler finalized_handler_;
    StateHandler state_handler_;
    LevelHandler level_handler_;
    ErrorHandler error_handler_;
};

} // namespace whispertrigger
