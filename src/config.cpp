#include "config.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <optional>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

/// Expands leading ~ to $HOME. ~user is not supported.
std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::optional<std::string> env_string(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return std::nullopt;
    return std::string(raw);
}

std::optional<uint64_t> env_u64(const char* name) {
    auto raw = env_string(name);
    if (!raw) return std::nullopt;
    return guild_voice::utils::parse_u64(guild_voice::utils::trim_copy(*raw));
}

std::optional<bool> env_bool(const char* name) {
    auto raw = env_string(name);
    if (!raw) return std::nullopt;
    std::string v = guild_voice::utils::trim_copy(*raw);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

/// Apply full JSON config (all sections) into cfg.
void apply_json_to_config(guild_voice::Config& cfg, const json& j) {
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    if (j.contains("voice") && j["voice"].is_object()) {
        auto& v = j["voice"];
        if (v.contains("enabled")) cfg.voice.enabled = v["enabled"];
        if (v.contains("allowlist") && v["allowlist"].is_string())
            cfg.voice.allowlist = guild_voice::parse_allowlist(v["allowlist"].get<std::string>());
        if (v.contains("idle_timeout_sec")) cfg.voice.idle_timeout = seconds(v["idle_timeout_sec"].get<uint64_t>());
        if (v.contains("chunk_gap_ms")) cfg.voice.default_chunk_gap = milliseconds(v["chunk_gap_ms"].get<uint64_t>());
        if (v.contains("listen_window_ms")) cfg.voice.default_listen_window = milliseconds(v["listen_window_ms"].get<uint64_t>());
        if (v.contains("max_turn_ms")) cfg.voice.default_max_turn = milliseconds(v["max_turn_ms"].get<uint64_t>());
        if (v.contains("reaper_interval_ms")) cfg.voice.reaper_interval = milliseconds(v["reaper_interval_ms"].get<uint64_t>());
        if (v.contains("pcm_channels")) cfg.voice.pcm_channels = v["pcm_channels"];
        if (v.contains("pcm_sample_rate")) cfg.voice.pcm_sample_rate = v["pcm_sample_rate"];
        if (v.contains("max_tts_input_chars")) cfg.voice.max_tts_input_chars = v["max_tts_input_chars"];
    }

    if (j.contains("speech") && j["speech"].is_object()) {
        auto& s = j["speech"];
        if (s.contains("provider")) cfg.speech.provider = s["provider"].get<std::string>();
        if (s.contains("openai_api_key")) cfg.speech.openai_api_key = s["openai_api_key"].get<std::string>();
        if (s.contains("openai_base_url")) cfg.speech.openai_base_url = s["openai_base_url"].get<std::string>();
        if (s.contains("stt_model")) cfg.speech.stt_model = s["stt_model"].get<std::string>();
        if (s.contains("tts_model")) cfg.speech.tts_model = s["tts_model"].get<std::string>();
        if (s.contains("tts_voice")) cfg.speech.tts_voice = s["tts_voice"].get<std::string>();
        if (s.contains("timeout_ms")) cfg.speech.timeout_ms = s["timeout_ms"];
        if (s.contains("whisper_model_path")) cfg.speech.whisper_model_path = s["whisper_model_path"].get<std::string>();
        if (s.contains("language")) cfg.speech.language = s["language"].get<std::string>();
        if (s.contains("use_gpu")) cfg.speech.use_gpu = s["use_gpu"];
    }

    if (j.contains("llm") && j["llm"].is_object()) {
        auto& l = j["llm"];
        if (l.contains("endpoint")) cfg.llm.endpoint = l["endpoint"].get<std::string>();
        if (l.contains("api_key")) cfg.llm.api_key = l["api_key"].get<std::string>();
        if (l.contains("model_name")) cfg.llm.model_name = l["model_name"].get<std::string>();
        if (l.contains("temperature")) cfg.llm.temperature = l["temperature"];
        if (l.contains("timeout_ms")) cfg.llm.timeout_ms = l["timeout_ms"];
        if (l.contains("max_tokens")) cfg.llm.max_tokens = l["max_tokens"];
        if (l.contains("history_messages")) cfg.llm.history_messages = l["history_messages"];
        if (l.contains("system_prompt")) cfg.llm.system_prompt = l["system_prompt"].get<std::string>();
    }

    if (j.contains("audio") && j["audio"].is_object()) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"].get<std::string>();
        if (a.contains("output_device")) cfg.audio.output_device = a["output_device"].get<std::string>();
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        auto& t = j["tools"];
        if (t.contains("max_concurrent")) cfg.tools.max_concurrent = t["max_concurrent"];
        if (t.contains("timeout_ms")) cfg.tools.timeout_ms = t["timeout_ms"];
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        auto& lg = j["logging"];
        if (lg.contains("level")) cfg.logging.level = lg["level"].get<std::string>();
        if (lg.contains("file")) cfg.logging.file = lg["file"].get<std::string>();
    }
}

} // anonymous namespace

namespace guild_voice {

VoiceAllowlist parse_allowlist(const std::string& raw) {
    VoiceAllowlist entries;
    for (const auto& pair : utils::split(raw, ',')) {
        std::string trimmed = utils::trim_copy(pair);
        if (trimmed.empty()) continue;

        auto parts = utils::split(trimmed, ':');
        if (parts.size() != 2) continue;

        auto guild_id = utils::parse_u64(utils::trim_copy(parts[0]));
        auto channel_id = utils::parse_u64(utils::trim_copy(parts[1]));
        if (!guild_id || !channel_id) continue;

        entries.emplace(*guild_id, *channel_id);
    }
    return entries;
}

Config Config::load_from_string(const std::string& json_text) {
    Config cfg;
    try {
        json j = json::parse(json_text);
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        return Config();
    }
    if (!cfg.speech.whisper_model_path.empty())
        cfg.speech.whisper_model_path = expand_path(cfg.speech.whisper_model_path);
    if (!cfg.logging.file.empty())
        cfg.logging.file = expand_path(cfg.logging.file);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        return Config();
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

void Config::apply_env_overrides() {
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    if (auto v = env_string("OPENAI_API_KEY")) speech.openai_api_key = *v;
    if (auto v = env_string("OPENAI_STT_MODEL")) speech.stt_model = *v;
    if (auto v = env_string("OPENAI_TTS_MODEL")) speech.tts_model = *v;
    if (auto v = env_string("OPENAI_TTS_VOICE")) speech.tts_voice = *v;
    if (auto v = env_string("LLM_API_KEY")) llm.api_key = *v;

    if (auto v = env_bool("VOICE_ENABLED")) voice.enabled = *v;
    if (auto v = env_string("VOICE_ALLOWLIST")) voice.allowlist = parse_allowlist(*v);
    if (auto v = env_u64("VOICE_IDLE_TIMEOUT_SEC")) voice.idle_timeout = seconds(*v);
    if (auto v = env_u64("VOICE_CHUNK_GAP_MS")) voice.default_chunk_gap = milliseconds(*v);
    if (auto v = env_u64("VOICE_MAX_TURN_MS")) voice.default_max_turn = milliseconds(*v);
    if (auto v = env_u64("VOICE_LISTEN_WINDOW_MS")) voice.default_listen_window = milliseconds(*v);
}

} // namespace guild_voice
