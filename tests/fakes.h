/**
 * In-memory stand-ins for the transport, speech services and reply
 * orchestrator, so the voice manager can be driven without a network,
 * sound card or model.
 */

#pragma once

#include "audio_sink.h"
#include "reply_orchestrator.h"
#include "speech_services.h"
#include "voice_transport.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace guild_voice {
namespace testing {

class FakeCall : public VoiceCall {
public:
    void set_audio_sink(std::shared_ptr<AudioSink> sink) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
        sink_installs_++;
    }

    Result<void> play(const WavBytes& wav) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_play) {
            return make_error(ErrorType::TransportError, "playback refused");
        }
        played_.push_back(wav);
        return Result<void>();
    }

    /// Deliver one speaking source to whatever sink is installed
    void speak(uint32_t ssrc, const AudioBuffer& samples) {
        std::shared_ptr<AudioSink> sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink = sink_;
        }
        if (!sink) return;
        VoiceTick tick;
        SpeakingSource source;
        source.ssrc = ssrc;
        source.decoded = samples;
        tick.speaking.push_back(source);
        sink->on_voice_tick(tick);
    }

    std::shared_ptr<AudioSink> sink() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sink_;
    }

    int sink_installs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sink_installs_;
    }

    std::vector<WavBytes> played() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return played_;
    }

    bool fail_play = false;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<AudioSink> sink_;
    int sink_installs_ = 0;
    std::vector<WavBytes> played_;
};

class FakeTransport : public VoiceTransport {
public:
    Result<std::shared_ptr<VoiceCall>> join(SnowflakeId guild_id, SnowflakeId channel_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        join_calls++;
        if (fail_join) {
            return make_error(ErrorType::TransportError, "gateway refused");
        }
        auto& call = calls_[guild_id];
        if (!call) {
            call = std::make_shared<FakeCall>();
        }
        channels_[guild_id] = channel_id;
        return std::static_pointer_cast<VoiceCall>(call);
    }

    Result<void> leave(SnowflakeId guild_id) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            leave_calls++;
            if (fail_leave) {
                return make_error(ErrorType::TransportError, "gateway refused");
            }
            calls_.erase(guild_id);
            channels_.erase(guild_id);
        }
        if (after_leave) {
            after_leave(guild_id);
        }
        return Result<void>();
    }

    std::shared_ptr<VoiceCall> get_call(SnowflakeId guild_id) override {
        return fake_call(guild_id);
    }

    std::shared_ptr<FakeCall> fake_call(SnowflakeId guild_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(guild_id);
        return it == calls_.end() ? nullptr : it->second;
    }

    /// Simulate the gateway dropping the call without a leave
    void drop_call(SnowflakeId guild_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.erase(guild_id);
    }

    bool fail_join = false;
    bool fail_leave = false;
    /// Runs once a leave has gone through, outside the transport lock
    std::function<void(SnowflakeId)> after_leave;
    int join_calls = 0;
    int leave_calls = 0;

private:
    std::mutex mutex_;
    std::map<SnowflakeId, std::shared_ptr<FakeCall>> calls_;
    std::map<SnowflakeId, SnowflakeId> channels_;
};

class FakeStt : public SpeechToText {
public:
    Result<std::string> transcribe(const WavBytes& wav) override {
        std::lock_guard<std::mutex> lock(mutex_);
        inputs.push_back(wav);
        if (fail) {
            return make_network_error("upstream 500");
        }
        return transcript;
    }

    std::string transcript = "hello there";
    bool fail = false;
    std::vector<WavBytes> inputs;

private:
    std::mutex mutex_;
};

class FakeTts : public TextToSpeech {
public:
    Result<WavBytes> synthesize(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        inputs.push_back(text);
        if (fail) {
            return make_network_error("upstream 503");
        }
        return WavBytes{'R', 'I', 'F', 'F'};
    }

    bool fail = false;
    std::vector<std::string> inputs;

private:
    std::mutex mutex_;
};

class FakeOrchestrator : public VoiceReplyOrchestrator {
public:
    Result<std::string> handle_voice_transcript(const MessageContext& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts.push_back(context);
        if (fail) {
            return make_network_error("model offline");
        }
        return reply;
    }

    std::string reply = "Hi everyone!";
    bool fail = false;
    std::vector<MessageContext> contexts;

private:
    std::mutex mutex_;
};

/// Small block of non-silent PCM
inline AudioBuffer pcm(size_t n, Sample value = 1000) {
    return AudioBuffer(n, value);
}

} // namespace testing
} // namespace guild_voice
