#pragma once

/**
 * @file voice_transport.h
 * @brief Voice connection interfaces
 *
 * The manager only needs to join, leave, look up a live call, route its
 * audio to a sink and play a reply. Anything else about the connection is
 * the transport's business.
 */

#include "common.h"
#include "errors.h"
#include <memory>

namespace guild_voice {

class AudioSink;

/**
 * @brief A live voice connection in one room
 */
class VoiceCall {
public:
    virtual ~VoiceCall() = default;

    /**
     * @brief Route incoming audio ticks to sink
     *
     * Replaces any previously installed sink; nullptr removes it.
     */
    virtual void set_audio_sink(std::shared_ptr<AudioSink> sink) = 0;

    /**
     * @brief Play a WAV buffer into the call
     */
    virtual Result<void> play(const WavBytes& wav) = 0;
};

/**
 * @brief Connects to and disconnects from voice channels
 */
class VoiceTransport {
public:
    virtual ~VoiceTransport() = default;

    virtual Result<std::shared_ptr<VoiceCall>> join(SnowflakeId guild_id, SnowflakeId channel_id) = 0;

    virtual Result<void> leave(SnowflakeId guild_id) = 0;

    /// Live call for the room, nullptr when not connected
    virtual std::shared_ptr<VoiceCall> get_call(SnowflakeId guild_id) = 0;
};

} // namespace guild_voice
