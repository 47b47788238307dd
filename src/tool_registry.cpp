#include "tool_registry.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace guild_voice {

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    std::lock_guard<std::mutex> lock(mutex_);
    if (tools_.find(name) != tools_.end()) {
        Logger::warn("Tool '" + name + "' is already registered. Skipping.");
        return false;
    }

    tools_[name] = std::move(tool);
    LOG_TOOL("Registered tool: " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::string ToolRegistry::get_tool_definitions_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json tools_array = json::array();

    for (const auto& [name, tool] : tools_) {
        json function_def;
        function_def["name"] = tool->name();
        function_def["description"] = tool->description();

        try {
            function_def["parameters"] = json::parse(tool->parameter_schema());
        } catch (const json::exception& e) {
            Logger::error("Failed to parse parameter schema for tool '" + name + "': " + e.what());
            function_def["parameters"] = json::object();
        }

        json tool_def;
        tool_def["type"] = "function";
        tool_def["function"] = function_def;
        tools_array.push_back(tool_def);
    }

    return tools_array.dump();
}

ToolResult ToolRegistry::execute(const std::string& name,
                                 const ToolCallContext& context,
                                 const std::string& params_json) const {
    auto tool = get_tool(name);
    if (!tool) {
        return ToolResult::error_result("Tool not found: " + name);
    }
    return tool->execute(context, params_json);
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

} // namespace guild_voice
