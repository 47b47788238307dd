#pragma once

/**
 * @file speech_services.h
 * @brief Speech-to-text and text-to-speech interfaces
 *
 * Both directions exchange WAV bytes so a backend can be swapped (cloud
 * API, local whisper) without touching the voice pipeline.
 */

#include "common.h"
#include "errors.h"
#include <string>

namespace guild_voice {

class SpeechToText {
public:
    virtual ~SpeechToText() = default;

    /**
     * @brief Transcribe a WAV buffer
     * @return Raw transcript (may be blank)
     */
    virtual Result<std::string> transcribe(const WavBytes& wav) = 0;
};

class TextToSpeech {
public:
    virtual ~TextToSpeech() = default;

    /**
     * @brief Synthesize text to a WAV buffer
     */
    virtual Result<WavBytes> synthesize(const std::string& text) = 0;
};

} // namespace guild_voice
