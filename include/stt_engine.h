#pragma once

#include "common.h"
#include "config.h"
#include "speech_services.h"
#include <string>
#include <memory>

namespace guild_voice {

/// Sample rate whisper.cpp expects
constexpr int WHISPER_SAMPLE_RATE = 16000;

/**
 * @brief Local speech-to-text on whisper.cpp
 *
 * Decodes the WAV, downmixes to mono and resamples to 16 kHz before
 * inference. If the model failed to load every call fails with IOError.
 */
class WhisperSpeechToText : public SpeechToText {
public:
    explicit WhisperSpeechToText(const SpeechConfig& config);
    ~WhisperSpeechToText() override;

    // Non-copyable
    WhisperSpeechToText(const WhisperSpeechToText&) = delete;
    WhisperSpeechToText& operator=(const WhisperSpeechToText&) = delete;

    Result<std::string> transcribe(const WavBytes& wav) override;

    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace guild_voice
