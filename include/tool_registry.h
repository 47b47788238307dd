#pragma once

#include "tool.h"
#include <string>
#include <vector>
#include <memory>
#include <map>
#include <mutex>

namespace guild_voice {

/**
 * @brief Central registry for all available tools
 *
 * Manages tool registration, lookup, and provides tool definitions in the
 * OpenAI function-calling format.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @return true if registration successful, false if null or name taken
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Get a tool by name
     * @return Shared pointer to tool, or nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    /**
     * @brief Get all registered tool names (sorted)
     */
    std::vector<std::string> get_tool_names() const;

    /**
     * @brief Get tool definitions in Ollama/OpenAI format
     * @return JSON array of tool definitions
     */
    std::string get_tool_definitions_json() const;

    /**
     * @brief Look up and run a tool on the calling thread
     *
     * Unknown tools yield an error result.
     */
    ToolResult execute(const std::string& name,
                       const ToolCallContext& context,
                       const std::string& params_json) const;

    bool has_tool(const std::string& name) const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace guild_voice
