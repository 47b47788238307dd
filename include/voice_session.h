#pragma once

#include "common.h"
#include "errors.h"
#include "voice_types.h"
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>

namespace guild_voice {

/**
 * @brief Per-room chunk queue and turn capture
 *
 * Shared between the manager (tool calls) and the transport's audio sink.
 * The queue mutex only covers enqueue/dequeue; the listen mutex is held by
 * one capture at a time and is independent of it, so pushes never wait on
 * an in-progress capture.
 */
class VoiceSession {
public:
    explicit VoiceSession(SnowflakeId channel_id);

    // Non-copyable
    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    SnowflakeId channel_id() const { return channel_id_; }

    /**
     * @brief Append a chunk to the queue tail and wake waiters
     *
     * Also counts as activity for idle eviction.
     */
    void push_chunk(AudioChunk chunk);

    /**
     * @brief Pop the queue head, blocking until a chunk is available
     */
    AudioChunk next_chunk();

    /**
     * @brief Pop the queue head, waiting at most timeout
     * @return Chunk, or nullopt when the wait expired
     */
    std::optional<AudioChunk> next_chunk_for(Duration timeout);

    /**
     * @brief Capture one turn of speech
     *
     * Waits up to listen_window for speech to start. Once the first chunk
     * arrives the turn clock starts; the turn ends after chunk_gap of
     * silence or when max_turn has elapsed since the first chunk.
     *
     * @return Turn with sorted speaker labels, or CaptureTimeout / EmptyTurn
     */
    Result<CapturedTurn> capture_turn(Duration listen_window, Duration chunk_gap, Duration max_turn);

    /// Drop all queued chunks
    void clear_chunks();

    size_t queued_chunks() const;

    void touch();
    Duration elapsed_since_last_activity() const;

    /**
     * @brief Acquire the listen lock
     *
     * Serializes clear_chunks + capture_turn across concurrent listeners.
     */
    std::unique_lock<std::mutex> lock_for_listen();

private:
    const SnowflakeId channel_id_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<AudioChunk> queue_;

    std::mutex listen_mutex_;

    mutable std::mutex activity_mutex_;
    TimePoint last_activity_;

    std::optional<AudioChunk> pop_until(TimePoint deadline);
};

} // namespace guild_voice
