#pragma once

#include "config.h"
#include "speech_services.h"
#include <string>

namespace guild_voice {

/**
 * @brief OpenAI audio API backend for both speech directions
 *
 * STT: multipart POST <base>/audio/transcriptions, returns the "text" field.
 * TTS: JSON POST <base>/audio/speech with response_format "wav".
 */
class OpenAiAudioClient : public SpeechToText, public TextToSpeech {
public:
    explicit OpenAiAudioClient(const SpeechConfig& config);

    Result<std::string> transcribe(const WavBytes& wav) override;
    Result<WavBytes> synthesize(const std::string& text) override;

private:
    SpeechConfig config_;

    std::string url(const std::string& path) const;
};

} // namespace guild_voice
