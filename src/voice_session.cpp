#include "voice_session.h"
#include "logger.h"
#include <set>
#include <algorithm>

namespace guild_voice {

VoiceSession::VoiceSession(SnowflakeId channel_id)
    : channel_id_(channel_id), last_activity_(Clock::now()) {}

void VoiceSession::push_chunk(AudioChunk chunk) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(chunk));
    }
    touch();
    queue_cv_.notify_all();
}

AudioChunk VoiceSession::next_chunk() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait(lock, [this] { return !queue_.empty(); });
    AudioChunk chunk = std::move(queue_.front());
    queue_.pop_front();
    return chunk;
}

std::optional<AudioChunk> VoiceSession::next_chunk_for(Duration timeout) {
    return pop_until(Clock::now() + timeout);
}

std::optional<AudioChunk> VoiceSession::pop_until(TimePoint deadline) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (!queue_cv_.wait_until(lock, deadline, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    AudioChunk chunk = std::move(queue_.front());
    queue_.pop_front();
    return chunk;
}

Result<CapturedTurn> VoiceSession::capture_turn(Duration listen_window,
                                                Duration chunk_gap,
                                                Duration max_turn) {
    auto first = next_chunk_for(listen_window);
    if (!first) {
        return make_error(ErrorType::CaptureTimeout,
                          "no speech within " + std::to_string(listen_window.count()) + "ms");
    }

    TimePoint turn_start = Clock::now();
    std::set<std::string> speakers;
    AudioBuffer samples;

    speakers.insert(first->speaker_label);
    samples.insert(samples.end(), first->samples.begin(), first->samples.end());

    size_t chunk_count = 1;
    while (true) {
        Duration elapsed = std::chrono::duration_cast<Duration>(Clock::now() - turn_start);
        Duration remaining = max_turn - elapsed;
        if (remaining <= Duration::zero()) {
            LOG_SESSION("turn hit max length " + std::to_string(max_turn.count()) + "ms");
            break;
        }

        auto chunk = next_chunk_for(std::min(remaining, chunk_gap));
        if (!chunk) {
            break;  // silence gap
        }

        speakers.insert(chunk->speaker_label);
        samples.insert(samples.end(), chunk->samples.begin(), chunk->samples.end());
        ++chunk_count;
    }

    if (samples.empty()) {
        return make_error(ErrorType::EmptyTurn, "captured turn contained no audio");
    }

    LOG_SESSION("captured " + std::to_string(chunk_count) + " chunks, " +
                std::to_string(samples.size()) + " samples in " +
                std::to_string(ms_since(turn_start)) + "ms");

    CapturedTurn turn;
    turn.speakers.assign(speakers.begin(), speakers.end());  // std::set keeps them sorted
    turn.samples = std::move(samples);
    return turn;
}

void VoiceSession::clear_chunks() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

size_t VoiceSession::queued_chunks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void VoiceSession::touch() {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    last_activity_ = Clock::now();
}

Duration VoiceSession::elapsed_since_last_activity() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return std::chrono::duration_cast<Duration>(Clock::now() - last_activity_);
}

std::unique_lock<std::mutex> VoiceSession::lock_for_listen() {
    return std::unique_lock<std::mutex>(listen_mutex_);
}

} // namespace guild_voice
