#include "stt_engine.h"
#include "audio_convert.h"
#include "logger.h"
#include "wav.h"
#include <whisper.h>
#include <mutex>
#include <vector>

namespace guild_voice {

class WhisperSpeechToText::Impl {
public:
    explicit Impl(const SpeechConfig& config) : config_(config), ctx_(nullptr) {
        if (config_.whisper_model_path.empty()) {
            LOG_STT("No whisper model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.whisper_model_path.c_str(), cparams);
        if (!ctx_) {
            LOG_ERROR("[STT] Failed to load whisper model: " + config_.whisper_model_path);
            return;
        }
        LOG_STT("Whisper model loaded: " + config_.whisper_model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<std::string> transcribe(const WavBytes& wav) {
        if (!ctx_) {
            return make_io_error("whisper model is not loaded");
        }

        auto decoded = decode_wav_pcm(wav);
        if (!decoded) {
            return decoded.error();
        }
        const WavAudio& audio = decoded.value();

        AudioBuffer mono = downmix_to_mono(audio.samples, audio.header.channels);
        mono = resample(mono, static_cast<int>(audio.header.sample_rate), WHISPER_SAMPLE_RATE);
        if (mono.empty()) {
            return std::string();
        }

        std::vector<float> pcmf32(mono.size());
        for (size_t i = 0; i < mono.size(); i++) {
            pcmf32[i] = static_cast<float>(mono[i]) / 32768.0f;
        }

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = 4;
        params.no_context = true;

        auto start = Clock::now();

        // A whisper_context is not reentrant
        std::lock_guard<std::mutex> lock(mutex_);
        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            return make_error(ErrorType::Unknown, "whisper_full failed: " + std::to_string(ret));
        }

        std::string text;
        int n_segments = whisper_full_n_segments(ctx_);
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
        }

        LOG_STT("Transcribed " + std::to_string(mono.size()) + " samples in " +
                std::to_string(ms_since(start)) + "ms");
        return text;
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    SpeechConfig config_;
    whisper_context* ctx_;
    std::mutex mutex_;
};

WhisperSpeechToText::WhisperSpeechToText(const SpeechConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperSpeechToText::~WhisperSpeechToText() = default;

Result<std::string> WhisperSpeechToText::transcribe(const WavBytes& wav) {
    return pimpl_->transcribe(wav);
}

bool WhisperSpeechToText::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace guild_voice
