#pragma once

#include "tool.h"
#include "errors.h"
#include <string>
#include <memory>

namespace guild_voice {

class VoiceManager;

/**
 * @brief Convert a manager result into a tool result
 *
 * Failures carry the error message and the error type name in
 * metadata["error_type"].
 */
ToolResult tool_result_from(const Result<std::string>& result);

/**
 * @brief Joins the requester's voice channel
 *
 * Params: {"channel_id": "<id>"} (optional).
 */
class VoiceJoinTool : public Tool {
public:
    explicit VoiceJoinTool(std::shared_ptr<VoiceManager> manager);

    std::string name() const override { return "discord_voice_join"; }

    std::string description() const override {
        return "Join the voice channel the requesting user is in (or channel_id if given) "
               "so later turns can be heard and answered in voice.";
    }

    std::string parameter_schema() const override;

    ToolResult execute(const ToolCallContext& context, const std::string& params_json) override;

private:
    std::shared_ptr<VoiceManager> manager_;
};

/**
 * @brief Captures one spoken turn and replies in voice
 *
 * Params: listen_window_ms, chunk_gap_ms, max_turn_ms (all optional,
 * non-negative integers; other types are ignored).
 */
class VoiceListenTurnTool : public Tool {
public:
    explicit VoiceListenTurnTool(std::shared_ptr<VoiceManager> manager);

    std::string name() const override { return "discord_voice_listen_turn"; }

    std::string description() const override {
        return "Listen for one spoken turn in the current voice channel, transcribe it, "
               "and speak a reply back into the channel.";
    }

    std::string parameter_schema() const override;

    ToolResult execute(const ToolCallContext& context, const std::string& params_json) override;

private:
    std::shared_ptr<VoiceManager> manager_;
};

class VoiceLeaveTool : public Tool {
public:
    explicit VoiceLeaveTool(std::shared_ptr<VoiceManager> manager);

    std::string name() const override { return "discord_voice_leave"; }

    std::string description() const override {
        return "Leave the voice channel. The requesting user must be in the same channel.";
    }

    std::string parameter_schema() const override;

    ToolResult execute(const ToolCallContext& context, const std::string& params_json) override;

private:
    std::shared_ptr<VoiceManager> manager_;
};

} // namespace guild_voice
