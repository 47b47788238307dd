#pragma once

#include "errors.h"
#include "voice_types.h"
#include <string>

namespace guild_voice {

/**
 * @brief Produces the spoken reply for a voice transcript
 */
class VoiceReplyOrchestrator {
public:
    virtual ~VoiceReplyOrchestrator() = default;

    virtual Result<std::string> handle_voice_transcript(const MessageContext& context) = 0;
};

} // namespace guild_voice
