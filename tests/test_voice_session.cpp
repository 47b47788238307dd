/**
 * Turn capture timing and the audio sink that feeds it.
 * Asserts:
 * - No speech within the listen window is a CaptureTimeout.
 * - A silence gap longer than chunk_gap ends the turn.
 * - Steady speech is cut at max_turn.
 * - Samples keep arrival order; speakers come back sorted and unique.
 * - Sources without decoded audio are ignored by the sink.
 *
 * Run from build dir: ./test_voice_session
 */

#include "audio_sink.h"
#include "logger.h"
#include "voice_session.h"
#include <atomic>
#include <iostream>
#include <thread>

using namespace guild_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static AudioChunk chunk(const std::string& speaker, Sample value, size_t n = 4) {
    return AudioChunk{speaker, AudioBuffer(n, value)};
}

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- listen window expires with no speech ---
    {
        VoiceSession session(42);
        auto start = Clock::now();
        auto turn = session.capture_turn(Duration(200), Duration(100), Duration(1000));
        ASSERT(!turn);
        ASSERT(turn.error().type == ErrorType::CaptureTimeout);
        ASSERT(turn.error().message == "no speech within 200ms");
        ASSERT(ms_since(start) >= 190);
    }

    // --- FIFO and next_chunk_for ---
    {
        VoiceSession session(1);
        session.push_chunk(chunk("a", 1));
        session.push_chunk(chunk("b", 2));
        ASSERT(session.queued_chunks() == 2);
        auto first = session.next_chunk_for(Duration(10));
        ASSERT(first && first->speaker_label == "a");
        AudioChunk second = session.next_chunk();
        ASSERT(second.speaker_label == "b");
        ASSERT(!session.next_chunk_for(Duration(20)));
    }

    // --- clear drops everything queued ---
    {
        VoiceSession session(1);
        session.push_chunk(chunk("a", 1));
        session.push_chunk(chunk("a", 2));
        session.clear_chunks();
        ASSERT(session.queued_chunks() == 0);
        auto turn = session.capture_turn(Duration(100), Duration(100), Duration(1000));
        ASSERT(!turn && turn.error().type == ErrorType::CaptureTimeout);
    }

    // --- gap ends the turn: chunks at 0/200/500ms, gap 700 ---
    {
        VoiceSession session(1);
        std::thread producer([&session] {
            session.push_chunk(chunk("ssrc:9", 1));
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            session.push_chunk(chunk("ssrc:3", 2));
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            session.push_chunk(chunk("ssrc:9", 3));
        });

        auto start = Clock::now();
        auto turn = session.capture_turn(Duration(2000), Duration(700), Duration(10000));
        int64_t elapsed = ms_since(start);
        producer.join();

        ASSERT(turn);
        if (turn) {
            const CapturedTurn& t = turn.value();
            ASSERT(t.samples.size() == 12);
            ASSERT(t.samples.front() == 1);
            ASSERT(t.samples[4] == 2);
            ASSERT(t.samples.back() == 3);
            ASSERT(t.speakers.size() == 2);
            ASSERT(t.speakers[0] == "ssrc:3");
            ASSERT(t.speakers[1] == "ssrc:9");
        }
        // last chunk at ~500ms, then a full 700ms gap
        ASSERT(elapsed >= 1100);
        ASSERT(elapsed < 3000);
    }

    // --- steady speech is cut at max_turn ---
    {
        VoiceSession session(1);
        std::atomic<bool> stop{false};
        std::thread producer([&session, &stop] {
            while (!stop) {
                session.push_chunk(chunk("ssrc:5", 7));
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        auto start = Clock::now();
        auto turn = session.capture_turn(Duration(2000), Duration(700), Duration(1000));
        int64_t elapsed = ms_since(start);
        stop = true;
        producer.join();

        ASSERT(turn);
        ASSERT(elapsed >= 990);
        ASSERT(elapsed < 1700);
        if (turn) {
            ASSERT(turn.value().speakers.size() == 1);
            ASSERT(!turn.value().samples.empty());
        }
    }

    // --- only empty chunks yields EmptyTurn ---
    {
        VoiceSession session(1);
        session.push_chunk(AudioChunk{"ssrc:1", AudioBuffer()});
        auto turn = session.capture_turn(Duration(100), Duration(100), Duration(1000));
        ASSERT(!turn && turn.error().type == ErrorType::EmptyTurn);
    }

    // --- activity tracking ---
    {
        VoiceSession session(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        ASSERT(session.elapsed_since_last_activity() >= Duration(50));
        session.push_chunk(chunk("a", 1));
        ASSERT(session.elapsed_since_last_activity() < Duration(50));
    }

    // --- sink: decoded sources become labelled chunks ---
    {
        auto session = std::make_shared<VoiceSession>(77);
        SessionAudioSink sink(session);

        VoiceTick tick;
        SpeakingSource talking;
        talking.ssrc = 1234;
        talking.decoded = AudioBuffer{1, 2, 3};
        SpeakingSource muted;
        muted.ssrc = 99;
        SpeakingSource silent;
        silent.ssrc = 100;
        silent.decoded = AudioBuffer();
        tick.speaking = {talking, muted, silent};

        sink.on_voice_tick(tick);
        ASSERT(session->queued_chunks() == 1);
        auto got = session->next_chunk_for(Duration(10));
        ASSERT(got && got->speaker_label == "ssrc:1234");
        ASSERT(got && got->samples.size() == 3);
        ASSERT(speaker_label_for_ssrc(5) == "ssrc:5");
        ASSERT(sink.session() == session);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All voice session tests passed.\n";
    return 0;
}
