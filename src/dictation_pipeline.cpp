#include "dictation_pipeline.hpp"

#include "errors.hpp"
#include "model_assets.hpp"

namespace whispertrigger {

std::string effective_models_dir(const Configuration &config) {
    return config.models_dir.empty() ? default_models_dir()
                                     : config.models_dir;
}

DictationPipeline::DictationPipeline(ConfigStore &config, AudioSource &audio,
                                     SpeechModel &model,
                                     const ModeCatalog &modes,
                                     TextGenerator *generator,
                                     Clipboard &clipboard,
                                     TextInjector *injector,
                                     Notifier &notifier)
    : config_(config),
      audio_(audio),
      modes_(modes),
      clipboard_(clipboard),
      injector_(injector),
      notifier_(notifier),
      post_(modes, generator),
      sink_(clipboard, injector),
      controller_(audio, config),
      service_(model),
      alive_(std::make_shared<bool>(true)) {
    audio_.set_device(config_.current().audio_device);

    controller_.set_finalized_handler(
        [this](std::unique_ptr<TranscriptionRequest> request) {
            on_finalized(std::move(request));
        });
    controller_.set_state_handler([this](RecordingState state) {
        if (state == RecordingState::Recording && injector_ != nullptr &&
            config_.current().inject_text) {
            injector_->remember_focus();
        }
        if (state_handler_) state_handler_(state);
    });
    controller_.set_level_handler([this](double level) {
        if (level_handler_) level_handler_(level);
    });
    controller_.set_error_handler([this](const GError *error) {
        notifier_.notify(NoticeLevel::Error, "Microphone unavailable",
                         error->message);
    });

    TranscriptionService::Handlers handlers;
    handlers.on_result = [this](const TranscriptionResult &result) {
        on_result(result);
    };
    handlers.on_failure = [this](uint64_t /*request_id*/,
                                 const GError *error) {
        notifier_.notify(NoticeLevel::Error, "Transcription failed",
                         error->message);
    };
    handlers.on_fallback = [this](const GError *reason) {
        // Reloads stay on the CPU from now on
        accelerator_available_ = false;
        device_ = ComputeDevice::Cpu;
        notifier_.notify(NoticeLevel::Warning, "GPU unavailable",
                         std::string(reason->message) +
                             "; continuing on the CPU");
    };
    handlers.on_model_loaded = [this](bool loaded, ComputeDevice device,
                                      const GError *error) {
        model_ready_ = loaded;
        if (loaded && device_ == ComputeDevice::Gpu &&
            device == ComputeDevice::Cpu) {
            accelerator_available_ = false;
        }
        device_ = device;
        if (!loaded) {
            notifier_.notify(NoticeLevel::Error, "Model failed to load",
                             error != nullptr ? error->message
                                              : "unknown error");
        }
    };
    service_.set_handlers(std::move(handlers));

    std::weak_ptr<bool> alive = alive_;
    config_.add_validator([alive](const Configuration &candidate,
                                  GError **error) {
        if (alive.expired()) return true;
        const std::string dir = effective_models_dir(candidate);
        if (resolve_model_path(dir, candidate.model_size, candidate.language)
                .empty()) {
            g_set_error(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_CONFIG,
                        "Model '%s' is not installed in %s",
                        model_size_name(candidate.model_size), dir.c_str());
            return false;
        }
        return true;
    });
    config_.add_validator([alive, this](const Configuration &candidate,
                                        GError **error) {
        if (alive.expired()) return true;
        if (!modes_.contains(candidate.processing_mode)) {
            g_set_error(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_CONFIG,
                        "Unknown processing mode '%s'",
                        candidate.processing_mode.c_str());
            return false;
        }
        return true;
    });
    config_.subscribe([alive, this](const Configuration &previous,
                                    const Configuration &current) {
        if (alive.expired()) return;
        on_config_changed(previous, current);
    });
}

DictationPipeline::~DictationPipeline() {
    alive_.reset();
}

void DictationPipeline::set_state_handler(StateHandler handler) {
    state_handler_ = std::move(handler);
}

void DictationPipeline::set_level_handler(LevelHandler handler) {
    level_handler_ = std::move(handler);
}

void DictationPipeline::set_delivered_handler(DeliveredHandler handler) {
    delivered_handler_ = std::move(handler);
}

void DictationPipeline::start(bool force_cpu, bool accelerator_available) {
    force_cpu_ = force_cpu;
    accelerator_available_ = accelerator_available;
    load_model(config_.current());
}

void DictationPipeline::load_model(const Configuration &config) {
    model_ready_ = false;

    const std::string dir = effective_models_dir(config);
    const std::string path =
        resolve_model_path(dir, config.model_size, config.language);
    if (path.empty()) {
        const auto candidates =
            model_file_candidates(config.model_size, config.language);
        g_warning("No %s model found in %s", model_size_name(config.model_size),
                  dir.c_str());
        notifier_.notify(NoticeLevel::Error, "Model not found",
                         "Download " + candidates.front() + " into " + dir);
        return;
    }

    device_ = resolve_compute_device(config.device, force_cpu_,
                                     accelerator_available_);
    service_.load_model(path, device_);
}

void DictationPipeline::on_config_changed(const Configuration &previous,
                                          const Configuration &current) {
    if (previous.audio_device != current.audio_device)
        audio_.set_device(current.audio_device);

    const bool english_only_changed =
        (previous.language == "en") != (current.language == "en");
    if (previous.model_size != current.model_size ||
        previous.device != current.device ||
        effective_models_dir(previous) != effective_models_dir(current) ||
        english_only_changed) {
        g_message("Model settings changed, reloading");
        load_model(current);
    }
}

void DictationPipeline::handle(RecordingEvent event) {
    controller_.handle(event);
}

bool DictationPipeline::transcribe_last() {
    const Configuration &config = config_.current();
    if (service_.retranscribe_last(config.language, config.processing_mode) ==
        0) {
        notifier_.notify(NoticeLevel::Info, "Nothing to transcribe",
                         "No recording has been made yet");
        return false;
    }
    notifier_.notify(NoticeLevel::Info, "WhisperTrigger",
                     "Transcribing the last recording...");
    return true;
}

bool DictationPipeline::copy_last_transcription() {
    if (last_text_.empty()) return false;
    clipboard_.set_text(last_text_);
    return true;
}

void DictationPipeline::on_finalized(
    std::unique_ptr<TranscriptionRequest> request) {
    service_.submit(std::move(request));
    notifier_.notify(NoticeLevel::Info, "WhisperTrigger", "Processing audio...");
}

void DictationPipeline::on_result(const TranscriptionResult &result) {
    if (result.raw_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        g_message("Transcription #%" G_GUINT64_FORMAT " is empty",
                  result.request_id);
        notifier_.notify(NoticeLevel::Info, "No speech detected",
                         "Nothing was copied");
        return;
    }

    const Configuration &config = config_.current();
    const std::string context =
        injector_ != nullptr ? injector_->focus_title() : "";

    std::weak_ptr<bool> alive = alive_;
    post_.process(result, config.instruction_text, context,
                  [this, alive](const std::string &text, const GError *notice) {
                      if (alive.expired()) return;
                      if (notice != nullptr) {
                          notifier_.notify(NoticeLevel::Warning,
                                           "Rewrite unavailable",
                                           notice->message);
                      }
                      deliver(text);
                  });
}

void DictationPipeline::deliver(const std::string &text) {
    GError *notice = nullptr;
    const Delivery delivery =
        sink_.deliver(text, config_.current().inject_text, &notice);
    if (delivery == Delivery::Empty) {
        notifier_.notify(NoticeLevel::Info, "No speech detected",
                         "Nothing was copied");
        return;
    }

    last_text_ = text;
    switch (delivery) {
    case Delivery::Empty:
        break;
    case Delivery::InjectionFailed:
        notifier_.notify(NoticeLevel::Warning, "Typing failed",
                         notice->message);
        g_error_free(notice);
        break;
    case Delivery::Injected:
        notifier_.notify(NoticeLevel::Info, "WhisperTrigger",
                         "Transcription complete and typed");
        break;
    case Delivery::ClipboardOnly:
        notifier_.notify(NoticeLevel::Info, "WhisperTrigger",
                         "Transcription copied to the clipboard");
        break;
    }

    if (delivered_handler_) delivered_handler_(text);
}

} // namespace whispertrigger
