#pragma once

#include "common.h"
#include "config.h"
#include "voice_transport.h"
#include <string>
#include <memory>

namespace guild_voice {

/**
 * @brief Voice transport backed by the local sound card (PortAudio)
 *
 * Serves one call at a time: joining opens a full-duplex stream at the
 * configured PCM format, every 20 ms input frame is delivered to the
 * installed sink as a tick from source SSRC 1, and play() queues decoded
 * WAV audio for output.
 *
 * Thread Safety:
 * - The PortAudio callback only moves frames between queues
 * - Ticks are delivered to the sink from a dedicated dispatch thread
 * - All public methods are safe to call from any thread
 */
class LocalVoiceTransport : public VoiceTransport {
public:
    /// Source id reported for the local microphone
    static constexpr uint32_t LOCAL_SSRC = 1;

    LocalVoiceTransport(const AudioConfig& audio, int sample_rate, int channels);
    ~LocalVoiceTransport() override;

    // Non-copyable
    LocalVoiceTransport(const LocalVoiceTransport&) = delete;
    LocalVoiceTransport& operator=(const LocalVoiceTransport&) = delete;

    Result<std::shared_ptr<VoiceCall>> join(SnowflakeId guild_id, SnowflakeId channel_id) override;
    Result<void> leave(SnowflakeId guild_id) override;
    std::shared_ptr<VoiceCall> get_call(SnowflakeId guild_id) override;

    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace guild_voice
