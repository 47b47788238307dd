#pragma once

#include "common.h"
#include <string>
#include <cstdint>
#include <set>
#include <utility>
#include <chrono>

namespace guild_voice {

/// (guild_id, channel_id) pairs where voice capture is permitted
using VoiceAllowlist = std::set<std::pair<SnowflakeId, SnowflakeId>>;

/**
 * @brief Parse "guild:channel,guild:channel" into an allowlist
 *
 * Entries that are empty, do not have exactly two ':'-separated parts, or do
 * not parse as unsigned 64-bit integers are dropped. Never fails; a fully
 * malformed string yields an empty (fail-closed) allowlist.
 */
VoiceAllowlist parse_allowlist(const std::string& raw);

struct VoiceConfig {
    bool enabled = false;
    /// Empty means no channel is permitted
    VoiceAllowlist allowlist;
    /// Zero disables idle eviction
    std::chrono::seconds idle_timeout{DEFAULT_IDLE_TIMEOUT_SEC};
    std::chrono::milliseconds default_chunk_gap{DEFAULT_CHUNK_GAP_MS};
    std::chrono::milliseconds default_listen_window{DEFAULT_LISTEN_WINDOW_MS};
    std::chrono::milliseconds default_max_turn{DEFAULT_MAX_TURN_MS};
    std::chrono::milliseconds reaper_interval{DEFAULT_REAPER_INTERVAL_MS};
    int pcm_channels = DEFAULT_PCM_CHANNELS;         ///< Channel count of decoded voice payloads
    int pcm_sample_rate = DEFAULT_PCM_SAMPLE_RATE;   ///< Sample rate of decoded voice payloads
    size_t max_tts_input_chars = MAX_TTS_INPUT_CHARS;
};

struct SpeechConfig {
    std::string provider = "openai";  ///< "openai" | "whisper" (whisper = local STT, TTS stays on openai)
    std::string openai_api_key;
    std::string openai_base_url = "https://api.openai.com/v1";
    std::string stt_model = "gpt-4o-mini-transcribe";
    std::string tts_model = "gpt-4o-mini-tts";
    std::string tts_voice = "alloy";
    int timeout_ms = 30000;
    std::string whisper_model_path;
    std::string language = "en";
    bool use_gpu = true;
};

struct LLMConfig {
    /// OpenAI-compatible ".../chat/completions" or Ollama ".../api/chat"
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string api_key;
    std::string model_name = "qwen2.5";
    float temperature = 0.7f;
    int timeout_ms = 20000;
    int max_tokens = 0;  ///< 0 = no limit
    size_t history_messages = 8;  ///< Rolling history per voice channel, 0 disables
    std::string system_prompt = "You are a friendly voice companion in a group voice call. "
                                "Reply in one to three short spoken sentences. "
                                "Transcripts may start with a [speakers:...] tag naming who spoke.";
};

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
};

struct ToolsConfig {
    size_t max_concurrent = 2;   ///< Tool worker threads
    int timeout_ms = 0;          ///< 0 = no timeout for execute_sync
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    VoiceConfig voice;
    SpeechConfig speech;
    LLMConfig llm;
    AudioConfig audio;
    ToolsConfig tools;
    LoggingConfig logging;

    /// Load from a JSON file; missing keys keep defaults, unreadable files yield defaults
    static Config load_from_file(const std::string& path);

    /// Load from a JSON string (same rules as load_from_file)
    static Config load_from_string(const std::string& json_text);

    /// Environment variables win over file values (secrets and voice tuning)
    void apply_env_overrides();
};

} // namespace guild_voice
