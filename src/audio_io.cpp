#include "audio_io.h"
#include "audio_convert.h"
#include "audio_sink.h"
#include "logger.h"
#include "utils.h"
#include "wav.h"
#include <portaudio.h>
#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>

namespace guild_voice {

namespace {

/// Limit on undelivered input frames (about two seconds)
constexpr size_t MAX_PENDING_INPUT_FRAMES = 100;

int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        return default_idx == paNoDevice ? -1 : default_idx;
    }

    // Numeric device index
    bool numeric = !name.empty() && name.find_first_not_of("0123456789") == std::string::npos;
    if (numeric) {
        auto device_idx = utils::parse_device_index(name, num_devices);
        return device_idx ? *device_idx : -1;
    }

    // Exact name match
    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || name != info->name) continue;
        if (is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0) {
            return i;
        }
    }
    return -1;
}

/**
 * @brief One open full-duplex stream and its queues
 */
class LocalVoiceCall : public VoiceCall {
public:
    LocalVoiceCall(SnowflakeId guild_id, int sample_rate, int channels)
        : guild_id_(guild_id),
          sample_rate_(sample_rate),
          channels_(channels),
          frames_per_buffer_(static_cast<unsigned long>(sample_rate * FRAME_SIZE_MS / 1000)) {}

    ~LocalVoiceCall() override {
        close();
    }

    SnowflakeId guild_id() const { return guild_id_; }

    Result<void> open(const std::string& input_device, const std::string& output_device) {
        int input_idx = find_device(input_device, true);
        if (input_idx < 0) {
            return make_io_error("Input device not found: " + input_device);
        }
        int output_idx = find_device(output_device, false);
        if (output_idx < 0) {
            return make_io_error("Output device not found: " + output_device);
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        Logger::info("Using input device: [" + std::to_string(input_idx) + "] " + input_info->name);
        Logger::info("Using output device: [" + std::to_string(output_idx) + "] " + output_info->name);

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = channels_;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = channels_;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_OpenStream(&stream_, &input_params, &output_params, sample_rate_,
                                    frames_per_buffer_, paClipOff, full_duplex_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            return make_io_error("Failed to open full-duplex stream: " + std::string(Pa_GetErrorText(err)));
        }

        running_ = true;
        dispatch_thread_ = std::thread(&LocalVoiceCall::dispatch_loop, this);

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            close();
            return make_io_error("Failed to start full-duplex stream: " + std::string(Pa_GetErrorText(err)));
        }

        std::ostringstream oss;
        oss << "Local call opened: " << sample_rate_ << "Hz, " << channels_
            << " channel(s), " << frames_per_buffer_ << " frames per tick";
        LOG_AUDIO(oss.str());
        return Result<void>();
    }

    void close() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        {
            std::lock_guard<std::mutex> lock(input_mutex_);
            running_ = false;
            input_queue_.clear();
        }
        input_cv_.notify_all();
        if (dispatch_thread_.joinable()) {
            dispatch_thread_.join();
        }
        {
            std::lock_guard<std::mutex> lock(playback_mutex_);
            playback_queue_.clear();
        }
    }

    void set_audio_sink(std::shared_ptr<AudioSink> sink) override {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = std::move(sink);
    }

    Result<void> play(const WavBytes& wav) override {
        auto decoded = decode_wav_pcm(wav);
        if (!decoded) {
            return decoded.error().with_context("cannot play reply audio");
        }
        const WavAudio& audio = decoded.value();

        AudioBuffer mono = downmix_to_mono(audio.samples, audio.header.channels);
        mono = resample(mono, static_cast<int>(audio.header.sample_rate), sample_rate_);
        AudioBuffer out = upmix_from_mono(mono, channels_);

        const size_t frame_samples = frames_per_buffer_ * static_cast<size_t>(channels_);
        std::lock_guard<std::mutex> lock(playback_mutex_);
        for (size_t i = 0; i < out.size(); i += frame_samples) {
            size_t frame_size = std::min(frame_samples, out.size() - i);
            AudioBuffer frame(out.begin() + i, out.begin() + i + frame_size);
            // Pad the last frame
            frame.resize(frame_samples, 0);
            playback_queue_.push_back(std::move(frame));
        }

        LOG_AUDIO("Queued " + std::to_string(out.size()) + " samples for playback");
        return Result<void>();
    }

private:
    void dispatch_loop() {
        while (true) {
            AudioBuffer frame;
            {
                std::unique_lock<std::mutex> lock(input_mutex_);
                input_cv_.wait(lock, [this] { return !running_ || !input_queue_.empty(); });
                if (!running_) {
                    return;
                }
                frame = std::move(input_queue_.front());
                input_queue_.pop_front();
            }

            std::shared_ptr<AudioSink> sink;
            {
                std::lock_guard<std::mutex> lock(sink_mutex_);
                sink = sink_;
            }
            if (!sink) continue;

            VoiceTick tick;
            SpeakingSource source;
            source.ssrc = LocalVoiceTransport::LOCAL_SSRC;
            source.decoded = std::move(frame);
            tick.speaking.push_back(std::move(source));
            sink->on_voice_tick(tick);
        }
    }

    static int full_duplex_callback(const void* input, void* output,
                                    unsigned long frame_count,
                                    const PaStreamCallbackTimeInfo* time_info,
                                    PaStreamCallbackFlags status_flags,
                                    void* user_data) {
        (void)time_info;
        (void)status_flags;
        LocalVoiceCall* self = static_cast<LocalVoiceCall*>(user_data);
        const size_t sample_count = frame_count * static_cast<size_t>(self->channels_);

        // Input: hand the frame to the dispatch thread
        if (input) {
            const Sample* in = static_cast<const Sample*>(input);
            {
                std::lock_guard<std::mutex> input_lock(self->input_mutex_);
                if (self->input_queue_.size() < MAX_PENDING_INPUT_FRAMES) {
                    self->input_queue_.emplace_back(in, in + sample_count);
                }
            }
            self->input_cv_.notify_one();
        }

        // Output: next queued frame or silence
        Sample* out = static_cast<Sample*>(output);
        std::lock_guard<std::mutex> playback_lock(self->playback_mutex_);
        if (self->playback_queue_.empty()) {
            std::memset(out, 0, sample_count * sizeof(Sample));
            return paContinue;
        }

        const AudioBuffer& frame = self->playback_queue_.front();
        size_t n = std::min(sample_count, frame.size());
        std::memcpy(out, frame.data(), n * sizeof(Sample));
        if (n < sample_count) {
            std::memset(out + n, 0, (sample_count - n) * sizeof(Sample));
        }
        self->playback_queue_.pop_front();
        return paContinue;
    }

    const SnowflakeId guild_id_;
    const int sample_rate_;
    const int channels_;
    const unsigned long frames_per_buffer_;

    PaStream* stream_ = nullptr;

    std::mutex sink_mutex_;
    std::shared_ptr<AudioSink> sink_;

    std::mutex input_mutex_;
    std::condition_variable input_cv_;
    std::deque<AudioBuffer> input_queue_;
    bool running_ = false;
    std::thread dispatch_thread_;

    std::mutex playback_mutex_;
    std::deque<AudioBuffer> playback_queue_;
};

} // anonymous namespace

class LocalVoiceTransport::Impl {
public:
    Impl(const AudioConfig& audio, int sample_rate, int channels)
        : audio_(audio), sample_rate_(sample_rate), channels_(channels) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }
        initialized_ = true;
    }

    ~Impl() {
        std::shared_ptr<LocalVoiceCall> call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            call = std::move(call_);
        }
        if (call) {
            call->close();
        }
        if (initialized_) {
            Pa_Terminate();
        }
    }

    Result<std::shared_ptr<VoiceCall>> join(SnowflakeId guild_id, SnowflakeId channel_id) {
        if (!initialized_) {
            return make_io_error("PortAudio is not initialized");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (call_) {
            if (call_->guild_id() != guild_id) {
                return make_error(ErrorType::TransportError,
                                  "local audio device is in use by guild " + std::to_string(call_->guild_id()));
            }
            // Moving channels within the same guild keeps the open stream
            LOG_AUDIO("Reusing local call for guild " + std::to_string(guild_id) +
                      " channel " + std::to_string(channel_id));
            return std::static_pointer_cast<VoiceCall>(call_);
        }

        auto call = std::make_shared<LocalVoiceCall>(guild_id, sample_rate_, channels_);
        auto opened = call->open(audio_.input_device, audio_.output_device);
        if (!opened) {
            return opened.error();
        }
        call_ = call;
        LOG_AUDIO("Local call joined guild " + std::to_string(guild_id) +
                  " channel " + std::to_string(channel_id));
        return std::static_pointer_cast<VoiceCall>(call);
    }

    Result<void> leave(SnowflakeId guild_id) {
        std::shared_ptr<LocalVoiceCall> call;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!call_ || call_->guild_id() != guild_id) {
                return make_error(ErrorType::NotConnected,
                                  "no local call for guild " + std::to_string(guild_id));
            }
            call = std::move(call_);
        }
        call->close();
        return Result<void>();
    }

    std::shared_ptr<VoiceCall> get_call(SnowflakeId guild_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!call_ || call_->guild_id() != guild_id) {
            return nullptr;
        }
        return call_;
    }

private:
    AudioConfig audio_;
    int sample_rate_;
    int channels_;
    bool initialized_ = false;

    std::mutex mutex_;
    std::shared_ptr<LocalVoiceCall> call_;
};

LocalVoiceTransport::LocalVoiceTransport(const AudioConfig& audio, int sample_rate, int channels)
    : pimpl_(std::make_unique<Impl>(audio, sample_rate, channels)) {}

LocalVoiceTransport::~LocalVoiceTransport() = default;

Result<std::shared_ptr<VoiceCall>> LocalVoiceTransport::join(SnowflakeId guild_id, SnowflakeId channel_id) {
    return pimpl_->join(guild_id, channel_id);
}

Result<void> LocalVoiceTransport::leave(SnowflakeId guild_id) {
    return pimpl_->leave(guild_id);
}

std::shared_ptr<VoiceCall> LocalVoiceTransport::get_call(SnowflakeId guild_id) {
    return pimpl_->get_call(guild_id);
}

void LocalVoiceTransport::list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");
    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

} // namespace guild_voice
