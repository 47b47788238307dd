#include "tools/voice_tools.h"
#include "voice_manager.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace guild_voice {

namespace {

/// Parse tool params; blank input means no params
Result<json> parse_params(const std::string& params_json) {
    if (utils::is_empty_or_whitespace(params_json)) {
        return json::object();
    }
    try {
        json params = json::parse(params_json);
        if (!params.is_object()) {
            return make_parse_error("tool parameters must be a JSON object");
        }
        return params;
    } catch (const json::exception& e) {
        return make_parse_error("Invalid tool parameters: " + std::string(e.what()));
    }
}

std::optional<uint64_t> optional_u64(const json& params, const char* key) {
    if (params.contains(key) && params[key].is_number_unsigned()) {
        return params[key].get<uint64_t>();
    }
    return std::nullopt;
}

json duration_property(const char* description) {
    return json::object({
        {"type", "integer"},
        {"minimum", 0},
        {"description", description}
    });
}

} // anonymous namespace

ToolResult tool_result_from(const Result<std::string>& result) {
    if (result) {
        return ToolResult::success_result(result.value());
    }
    const Error& error = result.error();
    ToolResult tool_result = ToolResult::error_result(error.message);
    tool_result.metadata["error_type"] = error_type_name(error.type);
    return tool_result;
}

// ---------------------------------------------------------------------------

VoiceJoinTool::VoiceJoinTool(std::shared_ptr<VoiceManager> manager)
    : manager_(std::move(manager)) {}

std::string VoiceJoinTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["channel_id"] = json::object({
        {"type", "string"},
        {"description", "Voice channel id to join; defaults to the requester's current channel"}
    });
    return schema.dump();
}

ToolResult VoiceJoinTool::execute(const ToolCallContext& context, const std::string& params_json) {
    auto params = parse_params(params_json);
    if (!params) {
        return ToolResult::error_result(params.error().message);
    }

    JoinArgs args;
    const json& p = params.value();
    if (p.contains("channel_id") && p["channel_id"].is_string()) {
        args.channel_id = p["channel_id"].get<std::string>();
    }

    auto result = tool_result_from(manager_->join_for_requester(context.guild_id, context.user_id, args));
    if (!result.success) {
        LOG_TOOL("discord_voice_join failed: " + result.error);
    }
    return result;
}

// ---------------------------------------------------------------------------

VoiceListenTurnTool::VoiceListenTurnTool(std::shared_ptr<VoiceManager> manager)
    : manager_(std::move(manager)) {}

std::string VoiceListenTurnTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["listen_window_ms"] =
        duration_property("How long to wait for someone to start speaking (1000-60000)");
    schema["properties"]["chunk_gap_ms"] =
        duration_property("Silence that ends the turn (100-3000)");
    schema["properties"]["max_turn_ms"] =
        duration_property("Maximum turn length once speech starts (1000-60000)");
    return schema.dump();
}

ToolResult VoiceListenTurnTool::execute(const ToolCallContext& context, const std::string& params_json) {
    auto params = parse_params(params_json);
    if (!params) {
        return ToolResult::error_result(params.error().message);
    }

    ListenArgs args;
    args.listen_window_ms = optional_u64(params.value(), "listen_window_ms");
    args.chunk_gap_ms = optional_u64(params.value(), "chunk_gap_ms");
    args.max_turn_ms = optional_u64(params.value(), "max_turn_ms");

    auto result = tool_result_from(
        manager_->listen_and_respond_for_requester(context.guild_id, context.user_id, args));
    if (!result.success) {
        LOG_TOOL("discord_voice_listen_turn failed: " + result.error);
    }
    return result;
}

// ---------------------------------------------------------------------------

VoiceLeaveTool::VoiceLeaveTool(std::shared_ptr<VoiceManager> manager)
    : manager_(std::move(manager)) {}

std::string VoiceLeaveTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object();
    return schema.dump();
}

ToolResult VoiceLeaveTool::execute(const ToolCallContext& context, const std::string& params_json) {
    auto params = parse_params(params_json);
    if (!params) {
        return ToolResult::error_result(params.error().message);
    }

    auto result = tool_result_from(manager_->leave_for_requester(context.guild_id, context.user_id));
    if (!result.success) {
        LOG_TOOL("discord_voice_leave failed: " + result.error);
    }
    return result;
}

} // namespace guild_voice
