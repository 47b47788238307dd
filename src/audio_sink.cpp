#include "audio_sink.h"
#include "voice_session.h"

namespace guild_voice {

std::string speaker_label_for_ssrc(uint32_t ssrc) {
    return "ssrc:" + std::to_string(ssrc);
}

SessionAudioSink::SessionAudioSink(std::shared_ptr<VoiceSession> session)
    : session_(std::move(session)) {}

void SessionAudioSink::on_voice_tick(const VoiceTick& tick) {
    for (const auto& source : tick.speaking) {
        if (!source.decoded || source.decoded->empty()) {
            continue;
        }
        session_->push_chunk(AudioChunk{speaker_label_for_ssrc(source.ssrc), *source.decoded});
    }
}

} // namespace guild_voice
