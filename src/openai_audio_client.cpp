#include "openai_audio_client.h"
#include "http_client.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace guild_voice {

OpenAiAudioClient::OpenAiAudioClient(const SpeechConfig& config) : config_(config) {
    if (config_.openai_api_key.empty()) {
        LOG_WARN("[Speech] OpenAI API key is empty; audio requests will be rejected");
    }
}

std::string OpenAiAudioClient::url(const std::string& path) const {
    std::string base = config_.openai_base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

Result<std::string> OpenAiAudioClient::transcribe(const WavBytes& wav) {
    std::vector<MultipartField> fields;
    fields.push_back({"file", std::string(wav.begin(), wav.end()), "voice-turn.wav", "audio/wav"});
    fields.push_back({"model", config_.stt_model, "", ""});

    LOG_STT("Uploading " + std::to_string(wav.size()) + " bytes to " + config_.stt_model);
    auto response = http_post_multipart(url("/audio/transcriptions"), fields,
                                        config_.openai_api_key, config_.timeout_ms);
    if (!response) {
        return response.error();
    }
    if (!response.value().is_success()) {
        return make_network_error("transcription request returned HTTP " +
                                  std::to_string(response.value().status) + ": " +
                                  response.value().body);
    }

    try {
        json body = json::parse(response.value().body);
        if (!body.contains("text") || !body["text"].is_string()) {
            return make_parse_error("transcription response has no text field");
        }
        return body["text"].get<std::string>();
    } catch (const json::exception& e) {
        return make_parse_error("JSON parse error: " + std::string(e.what()));
    }
}

Result<WavBytes> OpenAiAudioClient::synthesize(const std::string& text) {
    json request;
    request["model"] = config_.tts_model;
    request["voice"] = config_.tts_voice;
    request["input"] = text;
    request["response_format"] = "wav";

    std::string payload;
    try {
        payload = request.dump();
    } catch (const json::exception& e) {
        return make_parse_error("cannot encode TTS input: " + std::string(e.what()));
    }

    LOG_TTS("Synthesizing " + std::to_string(text.size()) + " bytes of text with " + config_.tts_model);
    auto response = http_post_json(url("/audio/speech"), payload,
                                   config_.openai_api_key, config_.timeout_ms);
    if (!response) {
        return response.error();
    }
    if (!response.value().is_success()) {
        return make_network_error("speech request returned HTTP " +
                                  std::to_string(response.value().status) + ": " +
                                  response.value().body);
    }

    const std::string& body = response.value().body;
    return WavBytes(body.begin(), body.end());
}

} // namespace guild_voice
