#pragma once

#include "voice_types.h"
#include <memory>

namespace guild_voice {

class VoiceSession;

/**
 * @brief Transport audio callback contract
 *
 * Called from the transport's audio thread once per tick.
 */
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual void on_voice_tick(const VoiceTick& tick) = 0;
};

/**
 * @brief Pushes decoded transport audio into a VoiceSession
 *
 * Each speaking source with a non-empty payload becomes one chunk labeled
 * "ssrc:<id>". Sources without decoded audio are skipped.
 */
class SessionAudioSink : public AudioSink {
public:
    explicit SessionAudioSink(std::shared_ptr<VoiceSession> session);

    void on_voice_tick(const VoiceTick& tick) override;

    const std::shared_ptr<VoiceSession>& session() const { return session_; }

private:
    std::shared_ptr<VoiceSession> session_;
};

/// Speaker label for a transport source id
std::string speaker_label_for_ssrc(uint32_t ssrc);

} // namespace guild_voice
