#pragma once

#include "common.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace guild_voice {

/**
 * @brief One decoded packet from one speaking source
 */
struct AudioChunk {
    std::string speaker_label;  // e.g. "ssrc:1234"
    AudioBuffer samples;
};

/**
 * @brief A captured turn: who spoke and the concatenated PCM
 */
struct CapturedTurn {
    std::vector<std::string> speakers;  // Sorted, unique
    AudioBuffer samples;                // Arrival order
};

/**
 * @brief A source that was speaking during one transport tick
 */
struct SpeakingSource {
    uint32_t ssrc = 0;
    std::optional<AudioBuffer> decoded;  // Absent when nothing decoded this tick
};

/**
 * @brief One transport audio tick (20 ms of audio per source)
 */
struct VoiceTick {
    std::vector<SpeakingSource> speaking;
};

/**
 * @brief Synthetic message handed to the reasoning collaborator
 *
 * user_id identifies the room and channel ("voice:<guild>:<channel>"),
 * not an individual speaker.
 */
struct MessageContext {
    std::string message_id;
    std::string user_id;
    std::string guild_id;
    std::string channel_id;
    std::string content;
    int64_t timestamp_ms = 0;
};

/// Optional arguments for a join request
struct JoinArgs {
    std::optional<std::string> channel_id;  // Overrides the requester's current channel
};

/// Optional per-call capture overrides, clamped by the manager
struct ListenArgs {
    std::optional<uint64_t> listen_window_ms;
    std::optional<uint64_t> chunk_gap_ms;
    std::optional<uint64_t> max_turn_ms;
};

} // namespace guild_voice
