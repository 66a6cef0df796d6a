#include "whisper_model.hpp"

#include "errors.hpp"

#include <ggml-backend.h>
#include <ggml.h>
#include <whisper.h>

#include <algorithm>
#include <new>
#include <thread>

namespace whispertrigger {

namespace {

constexpr int BEAM_SIZE = 5;

void on_whisper_log(enum ggml_log_level level, const char *text,
                    void * /*user_data*/) {
    if (text == nullptr) return;
    std::string line(text);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();
    if (line.empty()) return;

    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        g_warning("whisper: %s", line.c_str());
        break;
    default:
        g_debug("whisper: %s", line.c_str());
        break;
    }
}

} // namespace

bool probe_accelerator(std::string *description) {
    ggml_backend_load_all();

    for (size_t i = 0; i < ggml_backend_dev_count(); i++) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        if (ggml_backend_dev_type(dev) == GGML_BACKEND_DEVICE_TYPE_GPU) {
            if (description != nullptr)
                *description = ggml_backend_dev_description(dev);
            return true;
        }
    }
    return false;
}

void install_whisper_log_handler() {
    whisper_log_set(on_whisper_log, nullptr);
    ggml_log_set(on_whisper_log, nullptr);
}

WhisperModel::WhisperModel() {
    const int hw = static_cast<int>(std::thread::hardware_concurrency());
    // Leave one core for the main loop and PulseAudio
    n_threads_ = std::max(1, std::min(8, hw - 1));
}

WhisperModel::~WhisperModel() {
    unload();
}

void WhisperModel::unload() {
    if (ctx_ != nullptr) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperModel::load(const std::string &path, ComputeDevice device,
                        GError **error) {
    unload();

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = device == ComputeDevice::Gpu;

    try {
        ctx_ = whisper_init_from_file_with_params(path.c_str(), cparams);
    } catch (const std::bad_alloc &) {
        ctx_ = nullptr;
        g_set_error(error, WHISPERTRIGGER_ERROR, WHISPERTRIGGER_ERROR_MODEL,
                    "Out of memory loading %s", path.c_str());
        return false;
    }

    if (ctx_ == nullptr) {
        if (device == ComputeDevice::Gpu) {
            g_set_error(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_ACCELERATOR,
                        "GPU initialization failed for %s", path.c_str());
        } else {
            g_set_error(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_MODEL, "Cannot load model %s",
                        path.c_str());
        }
        return false;
    }

    path_ = path;
    device_ = device;
    g_message("Loaded %s (%s, %d threads)", path.c_str(),
              compute_device_name(device), n_threads_);
    return true;
}

bool WhisperModel::switch_to_cpu(GError **error) {
    if (path_.empty()) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_MODEL, "Model not loaded");
        return false;
    }
    const std::string path = path_;
    return load(path, ComputeDevice::Cpu, error);
}

bool WhisperModel::transcribe(const std::vector<float> &pcm,
                              const std::string &language, Transcript *out,
                              GError **error) {
    if (ctx_ == nullptr) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_MODEL, "Model not loaded");
        return false;
    }

    whisper_full_params params =
        whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    params.beam_search.beam_size = BEAM_SIZE;
    params.n_threads = n_threads_;
    params.language = language.empty() ? "auto" : language.c_str();
    params.translate = false;
    params.no_context = true;
    params.suppress_blank = true;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    int rc = 0;
    try {
        rc = whisper_full(ctx_, params, pcm.data(),
                          static_cast<int>(pcm.size()));
    } catch (const std::bad_alloc &) {
        g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                            WHISPERTRIGGER_ERROR_MODEL,
                            "Out of memory during transcription");
        return false;
    }

    if (rc != 0) {
        if (device_ == ComputeDevice::Gpu) {
            g_set_error(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_ACCELERATOR,
                        "GPU inference failed (code %d)", rc);
        } else {
            g_set_error(error, WHISPERTRIGGER_ERROR,
                        WHISPERTRIGGER_ERROR_MODEL,
                        "Inference failed (code %d)", rc);
        }
        return false;
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; i++) {
        text += whisper_full_get_segment_text(ctx_, i);
    }

    const auto first = text.find_first_not_of(" \t\r\n");
    out->text = first == std::string::npos ? "" : text.substr(first);

    const int lang_id = whisper_full_lang_id(ctx_);
    out->language = lang_id >= 0 ? whisper_lang_str(lang_id) : language;
    return true;
}

} // namespace whispertrigger
