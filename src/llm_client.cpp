#include "llm_client.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <deque>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace guild_voice {

std::string build_chat_request(const LLMConfig& config,
                               const std::vector<ChatMessage>& messages,
                               bool ollama) {
    json msgs = json::array();
    for (const auto& m : messages) {
        msgs.push_back({{"role", m.role}, {"content", m.content}});
    }

    json request;
    request["model"] = config.model_name;
    request["messages"] = msgs;
    request["stream"] = false;
    if (ollama) {
        request["options"]["temperature"] = config.temperature;
        if (config.max_tokens > 0) {
            request["options"]["num_predict"] = config.max_tokens;
        }
    } else {
        request["temperature"] = config.temperature;
        if (config.max_tokens > 0) {
            request["max_tokens"] = config.max_tokens;
        }
    }
    return request.dump();
}

Result<std::string> parse_chat_response(const std::string& body, bool ollama) {
    std::string content;
    try {
        json response_json = json::parse(body);
        const json* message = nullptr;
        if (ollama) {
            if (response_json.contains("message")) {
                message = &response_json["message"];
            }
        } else if (response_json.contains("choices") && response_json["choices"].is_array() &&
                   !response_json["choices"].empty() &&
                   response_json["choices"][0].contains("message")) {
            message = &response_json["choices"][0]["message"];
        }

        if (!message) {
            return make_parse_error("no message in chat response");
        }
        if (message->contains("content") && (*message)["content"].is_string()) {
            content = (*message)["content"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return make_parse_error("JSON parse error: " + std::string(e.what()));
    }

    utils::trim(content);
    if (content.empty()) {
        return make_error(ErrorType::ParseError, "model returned empty content");
    }
    return content;
}

class LLMClient::Impl {
public:
    explicit Impl(const LLMConfig& config) : config_(config) {
        is_ollama_ = config.endpoint.find("/api/chat") != std::string::npos;
        LOG_LLM(std::string("Using ") + (is_ollama_ ? "Ollama" : "OpenAI-compatible") +
                " endpoint " + config_.endpoint + " model " + config_.model_name);
    }

    Result<std::string> handle_voice_transcript(const MessageContext& context) {
        std::vector<ChatMessage> messages;
        messages.push_back({"system", config_.system_prompt});
        {
            std::lock_guard<std::mutex> lock(history_mutex_);
            const auto& history = histories_[context.user_id];
            messages.insert(messages.end(), history.begin(), history.end());
        }
        messages.push_back({"user", context.content});

        auto reply = chat(messages);
        if (!reply) {
            return reply.error();
        }

        remember(context.user_id, ChatMessage{"user", context.content});
        remember(context.user_id, ChatMessage{"assistant", reply.value()});
        return reply;
    }

    Result<std::string> chat(const std::vector<ChatMessage>& messages) {
        std::string request_json;
        try {
            request_json = build_chat_request(config_, messages, is_ollama_);
        } catch (const json::exception& e) {
            return make_parse_error("cannot encode chat request: " + std::string(e.what()));
        }

        LOG_DEBUG("Sending chat request: " + request_json);
        auto response = http_post_json(config_.endpoint, request_json, config_.api_key, config_.timeout_ms);
        if (!response) {
            return response.error();
        }
        if (!response.value().is_success()) {
            return make_network_error("chat request returned HTTP " +
                                      std::to_string(response.value().status) + ": " +
                                      response.value().body);
        }

        auto content = parse_chat_response(response.value().body, is_ollama_);
        if (content) {
            LOG_LLM("Reply: " + content.value());
        }
        return content;
    }

    void clear_history(const std::string& user_id) {
        std::lock_guard<std::mutex> lock(history_mutex_);
        histories_.erase(user_id);
    }

    bool is_ollama() const { return is_ollama_; }

private:
    void remember(const std::string& user_id, ChatMessage message) {
        if (config_.history_messages == 0) {
            return;
        }
        std::lock_guard<std::mutex> lock(history_mutex_);
        auto& history = histories_[user_id];
        history.push_back(std::move(message));
        while (history.size() > config_.history_messages) {
            history.pop_front();
        }
    }

    LLMConfig config_;
    bool is_ollama_ = false;

    std::mutex history_mutex_;
    std::map<std::string, std::deque<ChatMessage>> histories_;
};

LLMClient::LLMClient(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

LLMClient::~LLMClient() = default;

Result<std::string> LLMClient::handle_voice_transcript(const MessageContext& context) {
    return pimpl_->handle_voice_transcript(context);
}

Result<std::string> LLMClient::chat(const std::vector<ChatMessage>& messages) {
    return pimpl_->chat(messages);
}

void LLMClient::clear_history(const std::string& user_id) {
    pimpl_->clear_history(user_id);
}

bool LLMClient::is_ollama() const {
    return pimpl_->is_ollama();
}

} // namespace guild_voice
