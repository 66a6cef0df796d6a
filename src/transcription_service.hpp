#pragma once

#include "speech_model.hpp"
#include "transcription.hpp"

#include <glib.h>

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace whispertrigger {

// Serializes all model work on one GThreadPool worker and reports back on
// the GMainContext that created the service.
class TranscriptionService {
public:
    struct Handlers {
        std::function<void(const TranscriptionResult &result)> on_result;
        std::function<void(uint64_t request_id, const GError *error)>
            on_failure;
        // The accelerator failed and the model moved to the CPU.
        std::function<void(const GError *reason)> on_fallback;
        std::function<void(bool loaded, ComputeDevice device,
                           const GError *error)>
            on_model_loaded;
    };

    explicit TranscriptionService(SpeechModel &model);
    ~TranscriptionService();

    TranscriptionService(const TranscriptionService &) = delete;
    TranscriptionService &operator=(const TranscriptionService &) = delete;

    void set_handlers(Handlers handlers);

    // Queued like a request so it never overlaps inference.
    void load_model(const std::string &path, ComputeDevice device);

    // Takes ownership of the request and returns its id immediately.
    uint64_t submit(std::unique_ptr<TranscriptionRequest> request);

    // Re-submits the most recently finalized audio. Returns 0 when nothing
    // has been recorded yet.
    uint64_t retranscribe_last(const std::string &language,
                               const std::string &processing_mode);

    bool has_last_audio() const { return last_audio_ != nullptr; }

    // Jobs queued or running that have not reported back yet.
    int pending() const { return pending_; }

private:
    struct Job;
    struct Outcome;
    struct Link {
        TranscriptionService *service;
    };

    static void run_job(gpointer data, gpointer user_data);
    static gboolean deliver_outcome(gpointer data);
    static void free_outcome(gpointer data);

    void execute_load(const Job &job);
    void execute_transcribe(std::unique_ptr<TranscriptionRequest> request);
    void post(std::unique_ptr<Outcome> outcome);
    void dispatch(Outcome &outcome);
    bool push(std::unique_ptr<Job> job);

    SpeechModel &model_;
    GThreadPool *pool_ = nullptr;
    GMainContext *context_ = nullptr;
    std::shared_ptr<Link> link_;
    std::atomic<bool> shutting_down_{false};

    Handlers handlers_;
    uint64_t next_id_ = 1;
    int pending_ = 0;
    std::shared_ptr<const std::vector<float>> last_audio_;
};

} // namespace whispertrigger
