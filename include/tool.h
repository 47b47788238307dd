#pragma once

#include <string>
#include <map>

namespace guild_voice {

/**
 * @brief Who invoked a tool and where
 *
 * Identifiers are decimal strings as the chat gateway delivers them.
 */
struct ToolCallContext {
    std::string guild_id;
    std::string user_id;
};

/**
 * @brief Result structure for tool execution
 */
struct ToolResult {
    bool success = false;
    std::string content;  // Result text for the model
    std::string error;    // Error message if failed
    std::map<std::string, std::string> metadata;  // Optional metadata

    static ToolResult success_result(const std::string& content) {
        ToolResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        return result;
    }
};

/**
 * @brief Abstract base class for all tools
 *
 * Tools are callable functions the model can invoke. Each tool provides:
 * - A unique name
 * - A clear description (for the model)
 * - A JSON schema for parameters
 * - An execute method that performs the tool's action
 */
class Tool {
public:
    virtual ~Tool() = default;

    /**
     * @brief Get the tool's unique name
     * @return Tool name (e.g., "discord_voice_join")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Get the tool's description for the model
     */
    virtual std::string description() const = 0;

    /**
     * @brief Get the JSON schema for tool parameters
     */
    virtual std::string parameter_schema() const = 0;

    /**
     * @brief Execute the tool with given parameters
     * @param context Invoking guild and user
     * @param params_json JSON object string containing tool parameters
     * @return ToolResult with success status and result content or error
     */
    virtual ToolResult execute(const ToolCallContext& context, const std::string& params_json) = 0;
};

} // namespace guild_voice
