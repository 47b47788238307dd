#pragma once

#include "common.h"
#include "config.h"
#include "reply_orchestrator.h"
#include <string>
#include <memory>
#include <vector>

namespace guild_voice {

/**
 * @brief One chat message sent to the model
 */
struct ChatMessage {
    std::string role;     // "system", "user", "assistant"
    std::string content;
};

/**
 * @brief Chat-completion backed reply generator
 *
 * Talks to an OpenAI-compatible ".../chat/completions" endpoint or an
 * Ollama ".../api/chat" endpoint (detected from the URL). Keeps a short
 * rolling history per synthetic voice user so follow-up turns in the same
 * channel have context.
 */
class LLMClient : public VoiceReplyOrchestrator {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    Result<std::string> handle_voice_transcript(const MessageContext& context) override;

    /**
     * @brief Send a chat request and return the assistant content
     * @param messages Full message list, system prompt first
     */
    Result<std::string> chat(const std::vector<ChatMessage>& messages);

    /// Forget the history kept for one voice user id
    void clear_history(const std::string& user_id);

    bool is_ollama() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Build the JSON request body for a chat endpoint
 */
std::string build_chat_request(const LLMConfig& config,
                               const std::vector<ChatMessage>& messages,
                               bool ollama);

/**
 * @brief Extract assistant content from a chat response body
 *
 * Ollama returns message.content; OpenAI-compatible servers return
 * choices[0].message.content. Blank content is an error.
 */
Result<std::string> parse_chat_response(const std::string& body, bool ollama);

} // namespace guild_voice
