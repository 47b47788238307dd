/**
 * Voice tools as the model sees them: registry dispatch, parameter
 * parsing, error metadata and execution through the worker pool.
 *
 * Run from build dir: ./test_voice_tools
 */

#include "fakes.h"
#include "logger.h"
#include "tool_executor.h"
#include "tool_registry.h"
#include "tools/voice_tools.h"
#include "voice_manager.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>
#include <thread>

using namespace guild_voice;
using namespace guild_voice::testing;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::string error_type_of(const ToolResult& result) {
    auto it = result.metadata.find("error_type");
    return it == result.metadata.end() ? "" : it->second;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    VoiceConfig config;
    config.enabled = true;
    config.allowlist = parse_allowlist("10:100");

    auto transport = std::make_shared<FakeTransport>();
    auto stt = std::make_shared<FakeStt>();
    auto tts = std::make_shared<FakeTts>();
    auto orchestrator = std::make_shared<FakeOrchestrator>();
    auto manager = std::make_shared<VoiceManager>(config, stt, tts);
    ASSERT(manager->configure(transport, orchestrator));

    ToolRegistry registry;
    ASSERT(registry.register_tool(std::make_shared<VoiceJoinTool>(manager)));
    ASSERT(registry.register_tool(std::make_shared<VoiceListenTurnTool>(manager)));
    ASSERT(registry.register_tool(std::make_shared<VoiceLeaveTool>(manager)));
    ASSERT(!registry.register_tool(std::make_shared<VoiceLeaveTool>(manager)));
    ASSERT(!registry.register_tool(nullptr));
    ASSERT(registry.size() == 3);

    // --- definitions ---
    {
        auto names = registry.get_tool_names();
        ASSERT(names.size() == 3);
        ASSERT(names[0] == "discord_voice_join");
        ASSERT(names[1] == "discord_voice_leave");
        ASSERT(names[2] == "discord_voice_listen_turn");

        json defs = json::parse(registry.get_tool_definitions_json());
        ASSERT(defs.is_array() && defs.size() == 3);
        for (const auto& def : defs) {
            ASSERT(def["type"] == "function");
            ASSERT(def["function"]["parameters"]["type"] == "object");
        }
        ASSERT(defs[2]["function"]["parameters"]["properties"].contains("chunk_gap_ms"));
    }

    ToolCallContext ctx;
    ctx.guild_id = "10";
    ctx.user_id = "1";

    // --- errors carry their kind ---
    {
        ToolResult result = registry.execute("discord_voice_join", ctx, "");
        ASSERT(!result.success);
        ASSERT(error_type_of(result) == "NotInVoice");

        result = registry.execute("discord_voice_leave", ctx, "{}");
        ASSERT(!result.success && error_type_of(result) == "NoActiveSession");

        result = registry.execute("discord_voice_join", ctx, "{\"channel_id\":\"999\"}");
        ASSERT(!result.success && error_type_of(result) == "ChannelNotAllowed");

        ToolCallContext bad = ctx;
        bad.guild_id = "not-a-guild";
        result = registry.execute("discord_voice_join", bad, "{}");
        ASSERT(!result.success && error_type_of(result) == "InvalidIdentifier");
    }

    // --- malformed params never reach the manager ---
    {
        ToolResult result = registry.execute("discord_voice_join", ctx, "{");
        ASSERT(!result.success);
        ASSERT(error_type_of(result).empty());

        result = registry.execute("discord_voice_leave", ctx, "[1,2]");
        ASSERT(!result.success && result.error == "tool parameters must be a JSON object");

        result = registry.execute("discord_voice_unknown", ctx, "{}");
        ASSERT(!result.success && result.error == "Tool not found: discord_voice_unknown");
        ASSERT(transport->join_calls == 0);
    }

    // --- join, listen, leave ---
    {
        ASSERT(manager->update_user_voice_state("10", "1", std::string("100")));
        ToolResult joined = registry.execute("discord_voice_join", ctx, "{}");
        ASSERT(joined.success && joined.content == "Joined voice channel 100");

        auto call = transport->fake_call(10);
        ASSERT(call != nullptr);
        std::thread speaker([call] {
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            call->speak(42, pcm(960));
        });
        // Non-integer values fall back to defaults; the rest are clamped
        ToolResult listened = registry.execute(
            "discord_voice_listen_turn", ctx,
            "{\"listen_window_ms\":1000,\"chunk_gap_ms\":1,\"max_turn_ms\":\"long\"}");
        speaker.join();
        ASSERT(listened.success);
        ASSERT(listened.content == "Processed voice turn and replied in voice. Transcript: hello there");
        ASSERT(orchestrator->contexts.size() == 1);
        ASSERT(orchestrator->contexts.size() == 1 &&
               orchestrator->contexts[0].content == "[speakers:ssrc:42] hello there");

        ToolResult timed_out = registry.execute(
            "discord_voice_listen_turn", ctx, "{\"listen_window_ms\":1000,\"chunk_gap_ms\":100}");
        ASSERT(!timed_out.success && error_type_of(timed_out) == "CaptureTimeout");

        ToolResult left = registry.execute("discord_voice_leave", ctx, "");
        ASSERT(left.success && left.content == "Left the voice channel.");
        ASSERT(!manager->has_session(10));
    }

    // --- worker pool ---
    {
        ToolExecutor executor(&registry, 2);

        ToolExecutionRequest request;
        request.tool_name = "discord_voice_leave";
        request.tool_call_id = "call-1";
        request.context = ctx;
        request.params_json = "{}";

        ToolExecutionResult sync = executor.execute_sync(request, 2000);
        ASSERT(sync.tool_call_id == "call-1");
        ASSERT(!sync.result.success && error_type_of(sync.result) == "NoActiveSession");

        std::atomic<int> callbacks{0};
        for (int i = 0; i < 4; ++i) {
            request.tool_call_id = "call-async-" + std::to_string(i);
            ASSERT(executor.execute_async(request, [&callbacks](const ToolExecutionResult& res) {
                if (!res.result.success) callbacks++;
            }));
        }
        ASSERT(executor.wait_for_completion(2000));
        ASSERT(callbacks == 4);
        ASSERT(executor.is_idle());
        ASSERT(executor.pending_count() == 0);

        request.tool_name = "nope";
        bool reported = false;
        ASSERT(!executor.execute_async(request, [&reported](const ToolExecutionResult& res) {
            reported = !res.result.success;
        }));
        ASSERT(reported);

        executor.shutdown();
        request.tool_name = "discord_voice_leave";
        ASSERT(!executor.execute_async(request, nullptr));
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All voice tool tests passed.\n";
    return 0;
}
