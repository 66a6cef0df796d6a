#include "recording_controller.hpp"

#include <cmath>
#include <cstdlib>

namespace whispertrigger {

namespace {

constexpr double DECAY_FACTOR = 0.85;

double calculate_peak_level(const int16_t *data, size_t num_samples) {
    int peak = 0;
    for (size_t i = 0; i < num_samples; i++) {
        int abs_val = std::abs(static_cast<int>(data[i]));
        if (abs_val > peak) {
            peak = abs_val;
        }
    }
    return static_cast<double>(peak) / 32768.0;
}

double calculate_rms(const int16_t *data, size_t num_samples) {
    if (num_samples == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < num_samples; i++) {
        double v = static_cast<double>(data[i]);
        sum += v * v;
    }
    return std::sqrt(sum / static_cast<double>(num_samples));
}

} // namespace

const char *recording_state_name(RecordingState state) {
    switch (state) {
    case RecordingState::Idle:
        return "idle";
    case RecordingState::Recording:
        return "recording";
    case RecordingState::Finalizing:
        return "finalizing";
    }
    return "";
}

RecordingController::RecordingController(AudioSource &audio,
                                         const ConfigStore &config)
    : audio_(audio), config_(config) {}

RecordingController::~RecordingController() {
    if (posted_source_ != 0) {
        g_source_remove(posted_source_);
        posted_source_ = 0;
    }
    if (audio_.is_open()) {
        audio_.close();
    }
}

void RecordingController::set_finalized_handler(FinalizedHandler handler) {
    finalized_handler_ = std::move(handler);
}

void RecordingController::set_state_handler(StateHandler handler) {
    state_handler_ = std::move(handler);
}

void RecordingController::set_level_handler(LevelHandler handler) {
    level_handler_ = std::move(handler);
}

void RecordingController::set_error_handler(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

double RecordingController::captured_seconds() const {
    if (!session_) return 0.0;
    return static_cast<double>(session_->samples.size()) / SAMPLE_RATE;
}

void RecordingController::handle(RecordingEvent event) {
    switch (event) {
    case RecordingEvent::Toggle:
        if (state_ == RecordingState::Idle) {
            begin();
        } else if (state_ == RecordingState::Recording) {
            finalize("stopped");
        }
        break;
    case RecordingEvent::Start:
        if (state_ == RecordingState::Idle) {
            begin();
        } else {
            g_debug("Start ignored, already %s", recording_state_name(state_));
        }
        break;
    case RecordingEvent::Stop:
        if (state_ == RecordingState::Recording) finalize("stopped");
        break;
    case RecordingEvent::MaxDurationReached:
        if (state_ == RecordingState::Recording)
            finalize("maximum duration reached");
        break;
    case RecordingEvent::SilenceDetected:
        if (state_ == RecordingState::Recording) finalize("silence detected");
        break;
    case RecordingEvent::DeviceFailed:
        if (state_ == RecordingState::Recording) finalize("device failed");
        break;
    }
}

// --- Transitions ---

void RecordingController::begin() {
    session_ = std::make_unique<RecordingSession>();
    session_->start_time = g_get_monotonic_time();
    level_ = 0.0;
    heard_speech_ = false;
    silent_samples_ = 0;

    GError *error = nullptr;
    if (!audio_.open(
            [this](const int16_t *samples, size_t count) {
                on_frames(samples, count);
            },
            [this](const GError *failure) { on_device_failure(failure); },
            &error)) {
        session_.reset();
        g_warning("Cannot start recording: %s",
                  error != nullptr ? error->message : "unknown error");
        if (error_handler_ && error != nullptr) error_handler_(error);
        g_clear_error(&error);
        return;
    }

    g_message("Recording started");
    set_state(RecordingState::Recording);
}

void RecordingController::finalize(const char *reason) {
    if (posted_source_ != 0) {
        g_source_remove(posted_source_);
        posted_source_ = 0;
    }

    session_->status = RecordingState::Finalizing;
    set_state(RecordingState::Finalizing);
    audio_.close();

    std::unique_ptr<RecordingSession> session = std::move(session_);
    level_ = 0.0;
    if (level_handler_) level_handler_(0.0);

    const size_t count = session->samples.size();
    const gint64 duration_ms =
        static_cast<gint64>(count) * 1000 / SAMPLE_RATE;

    if (duration_ms < config_.current().min_duration_ms) {
        g_message("Recording discarded (%s): %" G_GINT64_FORMAT
                  " ms is below the %d ms minimum",
                  reason, duration_ms, config_.current().min_duration_ms);
        set_state(RecordingState::Idle);
        return;
    }

    auto pcm = std::make_shared<std::vector<float>>(count);
    constexpr float scale = 1.0f / 32768.0f;
    for (size_t i = 0; i < count; i++) {
        (*pcm)[i] = static_cast<float>(session->samples[i]) * scale;
    }

    auto request = std::make_unique<TranscriptionRequest>();
    request->audio = std::move(pcm);
    request->language = config_.current().language;
    request->processing_mode = config_.current().processing_mode;

    g_message("Recording finished (%s): %.1f seconds", reason,
              static_cast<double>(count) / SAMPLE_RATE);

    if (finalized_handler_) finalized_handler_(std::move(request));
    set_state(RecordingState::Idle);
}

void RecordingController::set_state(RecordingState state) {
    if (state_ == state) return;
    state_ = state;
    if (state_handler_) state_handler_(state);
}

// --- Capture callbacks ---

void RecordingController::on_frames(const int16_t *samples, size_t count) {
    if (!session_ || state_ != RecordingState::Recording) return;
    if (posted_source_ != 0) return;  // already stopping

    session_->samples.insert(session_->samples.end(), samples,
                             samples + count);

    double peak = calculate_peak_level(samples, count);
    if (peak >= level_) {
        level_ = peak;
    } else {
        level_ = level_ * DECAY_FACTOR + peak * (1.0 - DECAY_FACTOR);
    }
    if (level_handler_) level_handler_(level_);

    const Configuration &config = config_.current();
    const size_t max_samples =
        static_cast<size_t>(config.max_duration_s) * SAMPLE_RATE;
    if (session_->samples.size() >= max_samples) {
        post(RecordingEvent::MaxDurationReached);
        return;
    }

    if (config.silence_duration_s > 0.0) {
        if (calculate_rms(samples, count) >= config.silence_threshold) {
            heard_speech_ = true;
            silent_samples_ = 0;
        } else if (heard_speech_) {
            silent_samples_ += count;
            if (silent_samples_ >=
                static_cast<size_t>(config.silence_duration_s * SAMPLE_RATE)) {
                post(RecordingEvent::SilenceDetected);
            }
        }
    }
}

void RecordingController::on_device_failure(const GError *error) {
    g_warning("Audio stream failed: %s", error->message);
    if (error_handler_) error_handler_(error);
    post(RecordingEvent::DeviceFailed);
}

void RecordingController::post(RecordingEvent event) {
    if (posted_source_ != 0) return;
    posted_event_ = event;
    posted_source_ = g_idle_add(dispatch_posted, this);
}

gboolean RecordingController::dispatch_posted(gpointer userdata) {
    auto *self = static_cast<RecordingController *>(userdata);
    self->posted_source_ = 0;
    self->handle(self->posted_event_);
    return G_SOURCE_REMOVE;
}

} // namespace whispertrigger
