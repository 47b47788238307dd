/**
 * Configuration loading: allowlist parsing, JSON sections and environment
 * overrides.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <iostream>
#include <utility>

using namespace guild_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool allows(const VoiceAllowlist& list, SnowflakeId guild, SnowflakeId channel) {
    return list.count(std::make_pair(guild, channel)) == 1;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- allowlist parsing ---
    {
        VoiceAllowlist list = parse_allowlist("1:2, 3:4 ,,bad,5:x,6:7:8, 9 : 10 ");
        ASSERT(list.size() == 3);
        ASSERT(allows(list, 1, 2));
        ASSERT(allows(list, 3, 4));
        ASSERT(allows(list, 9, 10));
        ASSERT(!allows(list, 6, 7));

        ASSERT(parse_allowlist("").empty());
        ASSERT(parse_allowlist("garbage").empty());
        ASSERT(parse_allowlist("-1:2").empty());
        ASSERT(parse_allowlist("1:2,1:2").size() == 1);
        ASSERT(allows(parse_allowlist("18446744073709551615:1"), 18446744073709551615ULL, 1));
    }

    // --- defaults ---
    {
        Config cfg;
        ASSERT(!cfg.voice.enabled);
        ASSERT(cfg.voice.allowlist.empty());
        ASSERT(cfg.voice.idle_timeout == std::chrono::seconds(300));
        ASSERT(cfg.voice.default_chunk_gap == Duration(700));
        ASSERT(cfg.voice.default_listen_window == Duration(12000));
        ASSERT(cfg.voice.default_max_turn == Duration(12000));
        ASSERT(cfg.voice.pcm_channels == 2);
        ASSERT(cfg.voice.pcm_sample_rate == 48000);
        ASSERT(cfg.speech.provider == "openai");
    }

    // --- JSON sections ---
    {
        Config cfg = Config::load_from_string(R"({
            "voice": {
                "enabled": true,
                "allowlist": "10:100,10:200",
                "idle_timeout_sec": 60,
                "chunk_gap_ms": 500,
                "listen_window_ms": 8000,
                "max_turn_ms": 15000,
                "reaper_interval_ms": 5000
            },
            "speech": {"provider": "whisper", "whisper_model_path": "/models/base.bin", "tts_voice": "nova"},
            "llm": {"endpoint": "http://localhost:8080/v1/chat/completions", "history_messages": 4},
            "tools": {"max_concurrent": 3},
            "logging": {"level": "debug"}
        })");
        ASSERT(cfg.voice.enabled);
        ASSERT(cfg.voice.allowlist.size() == 2);
        ASSERT(cfg.voice.idle_timeout == std::chrono::seconds(60));
        ASSERT(cfg.voice.default_chunk_gap == Duration(500));
        ASSERT(cfg.voice.default_listen_window == Duration(8000));
        ASSERT(cfg.voice.default_max_turn == Duration(15000));
        ASSERT(cfg.voice.reaper_interval == Duration(5000));
        ASSERT(cfg.speech.provider == "whisper");
        ASSERT(cfg.speech.whisper_model_path == "/models/base.bin");
        ASSERT(cfg.speech.tts_voice == "nova");
        ASSERT(cfg.speech.stt_model == "gpt-4o-mini-transcribe");
        ASSERT(cfg.llm.endpoint == "http://localhost:8080/v1/chat/completions");
        ASSERT(cfg.llm.history_messages == 4);
        ASSERT(cfg.tools.max_concurrent == 3);
        ASSERT(cfg.logging.level == "debug");
        ASSERT(Logger::parse_level(cfg.logging.level) == LogLevel::DEBUG);
    }

    // --- unreadable input falls back to defaults ---
    {
        Config broken = Config::load_from_string("{ not json");
        ASSERT(!broken.voice.enabled);
        Config missing = Config::load_from_file("/nonexistent/guild_voice.json");
        ASSERT(missing.voice.allowlist.empty());
    }

    // --- environment wins over the file ---
    {
        Config cfg = Config::load_from_string(R"({"voice": {"enabled": false, "allowlist": "1:1"}})");
        setenv("VOICE_ENABLED", "true", 1);
        setenv("VOICE_ALLOWLIST", "20:300", 1);
        setenv("VOICE_IDLE_TIMEOUT_SEC", "0", 1);
        setenv("VOICE_CHUNK_GAP_MS", "250", 1);
        setenv("VOICE_MAX_TURN_MS", "not-a-number", 1);
        setenv("OPENAI_API_KEY", "sk-test", 1);
        cfg.apply_env_overrides();

        ASSERT(cfg.voice.enabled);
        ASSERT(cfg.voice.allowlist.size() == 1);
        ASSERT(allows(cfg.voice.allowlist, 20, 300));
        ASSERT(cfg.voice.idle_timeout == std::chrono::seconds(0));
        ASSERT(cfg.voice.default_chunk_gap == Duration(250));
        ASSERT(cfg.voice.default_max_turn == Duration(12000));
        ASSERT(cfg.speech.openai_api_key == "sk-test");

        unsetenv("VOICE_ENABLED");
        unsetenv("VOICE_ALLOWLIST");
        unsetenv("VOICE_IDLE_TIMEOUT_SEC");
        unsetenv("VOICE_CHUNK_GAP_MS");
        unsetenv("VOICE_MAX_TURN_MS");
        unsetenv("OPENAI_API_KEY");
    }

    // --- log level names ---
    {
        ASSERT(Logger::parse_level("warn") == LogLevel::WARN);
        ASSERT(Logger::parse_level("ERROR") == LogLevel::ERROR);
        ASSERT(Logger::parse_level("chatty", LogLevel::INFO) == LogLevel::INFO);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
