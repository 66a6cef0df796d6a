#include "transcription_service.hpp"

#include "errors.hpp"

namespace whispertrigger {

struct TranscriptionService::Job {
    enum class Kind { Load, Transcribe };

    Kind kind = Kind::Transcribe;
    std::string model_path;
    ComputeDevice device = ComputeDevice::Cpu;
    std::unique_ptr<TranscriptionRequest> request;
};

struct TranscriptionService::Outcome {
    enum class Kind { Result, Failure, Fallback, ModelLoaded };

    Kind kind = Kind::Result;
    std::shared_ptr<Link> link;
    TranscriptionResult result;
    uint64_t request_id = 0;
    bool loaded = false;
    ComputeDevice device = ComputeDevice::Cpu;
    GError *error = nullptr;

    ~Outcome() { g_clear_error(&error); }
};

TranscriptionService::TranscriptionService(SpeechModel &model)
    : model_(model),
      context_(g_main_context_ref_thread_default()),
      link_(std::make_shared<Link>(Link{this})) {
    GError *error = nullptr;
    // One worker: the model is a shared, non-reentrant resource
    pool_ = g_thread_pool_new(run_job, this, 1, FALSE, &error);
    if (pool_ == nullptr) {
        g_critical("Cannot create transcription worker: %s", error->message);
        g_error_free(error);
    }
}

TranscriptionService::~TranscriptionService() {
    shutting_down_.store(true);
    if (pool_ != nullptr) {
        // Waits for the running job; queued ones are dropped by run_job
        g_thread_pool_free(pool_, FALSE, TRUE);
        pool_ = nullptr;
    }
    link_->service = nullptr;
    g_main_context_unref(context_);
}

void TranscriptionService::set_handlers(Handlers handlers) {
    handlers_ = std::move(handlers);
}

void TranscriptionService::load_model(const std::string &path,
                                      ComputeDevice device) {
    auto job = std::make_unique<Job>();
    job->kind = Job::Kind::Load;
    job->model_path = path;
    job->device = device;
    push(std::move(job));
}

uint64_t TranscriptionService::submit(
    std::unique_ptr<TranscriptionRequest> request) {
    request->id = next_id_++;
    last_audio_ = request->audio;

    const uint64_t id = request->id;
    g_debug("Queueing transcription #%" G_GUINT64_FORMAT " (%zu samples)", id,
            request->audio->size());

    auto job = std::make_unique<Job>();
    job->kind = Job::Kind::Transcribe;
    job->request = std::move(request);
    push(std::move(job));
    return id;
}

uint64_t TranscriptionService::retranscribe_last(
    const std::string &language, const std::string &processing_mode) {
    if (!last_audio_) return 0;

    auto request = std::make_unique<TranscriptionRequest>();
    request->audio = last_audio_;
    request->language = language;
    request->processing_mode = processing_mode;
    request->replay = true;
    return submit(std::move(request));
}

bool TranscriptionService::push(std::unique_ptr<Job> job) {
    pending_++;

    GError *error = nullptr;
    if (pool_ != nullptr && g_thread_pool_push(pool_, job.get(), &error)) {
        job.release();
        return true;
    }

    auto outcome = std::make_unique<Outcome>();
    outcome->link = link_;
    if (job->kind == Job::Kind::Load) {
        outcome->kind = Outcome::Kind::ModelLoaded;
    } else {
        outcome->kind = Outcome::Kind::Failure;
        outcome->request_id = job->request->id;
    }
    outcome->error = g_error_new(
        WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_MODEL,
        "Transcription worker unavailable: %s",
        error != nullptr ? error->message : "not started");
    g_clear_error(&error);
    post(std::move(outcome));
    return false;
}

// --- Worker thread ---

void TranscriptionService::run_job(gpointer data, gpointer user_data) {
    std::unique_ptr<Job> job(static_cast<Job *>(data));
    auto *self = static_cast<TranscriptionService *>(user_data);

    if (self->shutting_down_.load()) return;

    if (job->kind == Job::Kind::Load) {
        self->execute_load(*job);
    } else {
        self->execute_transcribe(std::move(job->request));
    }
}

void TranscriptionService::execute_load(const Job &job) {
    g_message("Loading model %s on %s", job.model_path.c_str(),
              compute_device_name(job.device));

    auto outcome = std::make_unique<Outcome>();
    outcome->kind = Outcome::Kind::ModelLoaded;
    outcome->link = link_;

    GError *error = nullptr;
    bool loaded = model_.load(job.model_path, job.device, &error);
    if (!loaded && job.device == ComputeDevice::Gpu &&
        g_error_matches(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_ACCELERATOR)) {
        g_warning("Accelerator unusable (%s), loading on CPU", error->message);

        auto fallback = std::make_unique<Outcome>();
        fallback->kind = Outcome::Kind::Fallback;
        fallback->link = link_;
        fallback->error = g_error_copy(error);
        post(std::move(fallback));

        g_clear_error(&error);
        loaded = model_.load(job.model_path, ComputeDevice::Cpu, &error);
    }

    outcome->loaded = loaded;
    outcome->device = model_.device();
    outcome->error = error;
    post(std::move(outcome));
}

void TranscriptionService::execute_transcribe(
    std::unique_ptr<TranscriptionRequest> request) {
    const gint64 started = g_get_monotonic_time();

    Transcript transcript;
    GError *error = nullptr;
    bool ok = false;
    if (!model_.is_loaded()) {
        g_set_error_literal(&error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_MODEL, "Model not loaded");
    } else {
        ok = model_.transcribe(*request->audio, request->language,
                               &transcript, &error);
    }

    if (!ok && g_error_matches(error, WHISPERTRIGGER_ERROR,
                               WHISPERTRIGGER_ERROR_ACCELERATOR)) {
        g_warning("Accelerator failed during transcription #%" G_GUINT64_FORMAT
                  " (%s), retrying on CPU",
                  request->id, error->message);

        auto fallback = std::make_unique<Outcome>();
        fallback->kind = Outcome::Kind::Fallback;
        fallback->link = link_;
        fallback->error = g_error_copy(error);
        post(std::move(fallback));
        g_clear_error(&error);

        GError *switch_error = nullptr;
        if (!model_.switch_to_cpu(&switch_error)) {
            error = g_error_new(WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_MODEL,
                                "CPU fallback failed: %s",
                                switch_error != nullptr
                                    ? switch_error->message
                                    : "unknown error");
            g_clear_error(&switch_error);
        } else {
            ok = model_.transcribe(*request->audio, request->language,
                                   &transcript, &error);
        }
    }

    auto outcome = std::make_unique<Outcome>();
    outcome->link = link_;
    outcome->request_id = request->id;

    if (!ok) {
        if (error == nullptr) {
            error = g_error_new_literal(WHISPERTRIGGER_ERROR,
                                        WHISPERTRIGGER_ERROR_MODEL,
                                        "Transcription failed");
        } else if (error->domain == WHISPERTRIGGER_ERROR &&
                   error->code == WHISPERTRIGGER_ERROR_ACCELERATOR) {
            error->code = WHISPERTRIGGER_ERROR_MODEL;
        }
        outcome->kind = Outcome::Kind::Failure;
        outcome->error = error;
        post(std::move(outcome));
        return;
    }

    g_message("Transcription #%" G_GUINT64_FORMAT
              " finished in %.2f s on %s: %zu characters",
              request->id,
              static_cast<double>(g_get_monotonic_time() - started) /
                  G_USEC_PER_SEC,
              compute_device_name(model_.device()), transcript.text.size());

    outcome->kind = Outcome::Kind::Result;
    outcome->result.request_id = request->id;
    outcome->result.raw_text = std::move(transcript.text);
    outcome->result.language = transcript.language.empty()
                                   ? request->language
                                   : transcript.language;
    outcome->result.processing_mode = request->processing_mode;
    outcome->result.device = model_.device();
    post(std::move(outcome));
}

// --- Handoff to the main loop ---

void TranscriptionService::post(std::unique_ptr<Outcome> outcome) {
    g_main_context_invoke_full(context_, G_PRIORITY_DEFAULT, deliver_outcome,
                               outcome.release(), free_outcome);
}

gboolean TranscriptionService::deliver_outcome(gpointer data) {
    auto *outcome = static_cast<Outcome *>(data);
    if (outcome->link->service != nullptr) {
        outcome->link->service->dispatch(*outcome);
    }
    return G_SOURCE_REMOVE;
}

void TranscriptionService::free_outcome(gpointer data) {
    delete static_cast<Outcome *>(data);
}

void TranscriptionService::dispatch(Outcome &outcome) {
    switch (outcome.kind) {
    case Outcome::Kind::Result:
        pending_--;
        if (handlers_.on_result) handlers_.on_result(outcome.result);
        break;
    case Outcome::Kind::Failure:
        pending_--;
        g_warning("Transcription #%" G_GUINT64_FORMAT " failed: %s",
                  outcome.request_id, outcome.error->message);
        if (handlers_.on_failure)
            handlers_.on_failure(outcome.request_id, outcome.error);
        break;
    case Outcome::Kind::Fallback:
        if (handlers_.on_fallback) handlers_.on_fallback(outcome.error);
        break;
    case Outcome::Kind::ModelLoaded:
        pending_--;
        if (outcome.loaded) {
            g_message("Model ready on %s", compute_device_name(outcome.device));
        } else {
            g_warning("Model load failed: %s", outcome.error != nullptr
                                                   ? outcome.error->message
                                                   : "unknown error");
        }
        if (handlers_.on_model_loaded)
            handlers_.on_model_loaded(outcome.loaded, outcome.device,
                                      outcome.error);
        break;
    }
}

} // namespace whispertrigger
