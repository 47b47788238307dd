#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace guild_voice {

// Audio types
using Sample = int16_t;
using AudioBuffer = std::vector<Sample>;
using WavBytes = std::vector<uint8_t>;

// Identifiers (guild, channel, user) as delivered by the chat gateway
using SnowflakeId = uint64_t;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Wall-clock milliseconds since the Unix epoch (for message ids)
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Transport PCM format (decoded voice payloads)
constexpr int DEFAULT_PCM_SAMPLE_RATE = 48000;
constexpr int DEFAULT_PCM_CHANNELS = 2;
constexpr int FRAME_SIZE_MS = 20;

// Turn capture defaults
constexpr int DEFAULT_LISTEN_WINDOW_MS = 12000;
constexpr int DEFAULT_CHUNK_GAP_MS = 700;
constexpr int DEFAULT_MAX_TURN_MS = 12000;
constexpr int DEFAULT_IDLE_TIMEOUT_SEC = 300;
constexpr int DEFAULT_REAPER_INTERVAL_MS = 30000;

// Per-call override bounds
constexpr int MIN_LISTEN_WINDOW_MS = 1000;
constexpr int MAX_LISTEN_WINDOW_MS = 60000;
constexpr int MIN_CHUNK_GAP_MS = 100;
constexpr int MAX_CHUNK_GAP_MS = 3000;
constexpr int MIN_MAX_TURN_MS = 1000;
constexpr int MAX_MAX_TURN_MS = 60000;

// Reply/result size limits
constexpr size_t MAX_TTS_INPUT_CHARS = 4000;
constexpr size_t MAX_TOOL_RESULT_TRANSCRIPT_CHARS = 220;

} // namespace guild_voice
