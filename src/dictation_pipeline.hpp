#pragma once

#include "audio_source.hpp"
#include "config_store.hpp"
#include "output_sink.hpp"
#include "post_processor.hpp"
#include "processing_modes.hpp"
#include "recording_controller.hpp"
#include "speech_model.hpp"
#include "transcription_service.hpp"

#include <functional>
#include <memory>
#include <string>

namespace whispertrigger {

enum class NoticeLevel { Info, Warning, Error };

// Non-blocking user notifications (GNotification in the application).
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(NoticeLevel level, const std::string &title,
                        const std::string &body) = 0;
};

// Main-loop orchestration: recorder -> transcription service ->
// post-processor -> output sink. The ConfigStore must outlive it.
class DictationPipeline {
public:
    using StateHandler = std::function<void(RecordingState state)>;
    using LevelHandler = std::function<void(double level)>;
    using DeliveredHandler = std::function<void(const std::string &text)>;

    DictationPipeline(ConfigStore &config, AudioSource &audio,
                      SpeechModel &model, const ModeCatalog &modes,
                      TextGenerator *generator, Clipboard &clipboard,
                      TextInjector *injector, Notifier &notifier);
    ~DictationPipeline();

    DictationPipeline(const DictationPipeline &) = delete;
    DictationPipeline &operator=(const DictationPipeline &) = delete;

    // Resolves the compute device and queues the initial model load.
    void start(bool force_cpu, bool accelerator_available);

    void handle(RecordingEvent event);

    // Re-runs the last finalized recording; false when there is none.
    bool transcribe_last();
    // Puts the last delivered text back on the clipboard.
    bool copy_last_transcription();

    void set_state_handler(StateHandler handler);
    void set_level_handler(LevelHandler handler);
    void set_delivered_handler(DeliveredHandler handler);

    RecordingState recording_state() const { return controller_.state(); }
    const std::string &last_transcription() const { return last_text_; }
    bool has_last_recording() const { return service_.has_last_audio(); }
    bool model_ready() const { return model_ready_; }
    ComputeDevice device() const { return device_; }
    int pending() const { return service_.pending(); }

private:
    void load_model(const Configuration &config);
    void on_config_changed(const Configuration &previous,
                           const Configuration &current);
    void on_finalized(std::unique_ptr<TranscriptionRequest> request);
    void on_result(const TranscriptionResult &result);
    void deliver(const std::string &text);

    ConfigStore &config_;
    AudioSource &audio_;
    const ModeCatalog &modes_;
    Clipboard &clipboard_;
    TextInjector *injector_;
    Notifier &notifier_;

    PostProcessor post_;
    OutputSink sink_;
    RecordingController controller_;
    TranscriptionService service_;

    bool force_cpu_ = false;
    bool accelerator_available_ = false;
    bool model_ready_ = false;
    ComputeDevice device_ = ComputeDevice::Cpu;
    std::string last_text_;

    // Cleared on destruction; rewrite callbacks check it.
    std::shared_ptr<bool> alive_;

    StateHandler state_handler_;
    LevelHandler level_handler_;
    DeliveredHandler delivered_handler_;
};

std::string effective_models_dir(const Configuration &config);

} // namespace whispertrigger
