#include "audio_io.h"
#include "config.h"
#include "llm_client.h"
#include "logger.h"
#include "openai_audio_client.h"
#include "stt_engine.h"
#include "tool_executor.h"
#include "tool_registry.h"
#include "tools/voice_tools.h"
#include "utils.h"
#include "voice_manager.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <sstream>

namespace guild_voice {

static std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

namespace {

void print_help() {
    Logger::info("Commands:");
    Logger::info("  guild <id>                       set the guild used by later commands");
    Logger::info("  presence <user> <channel|none>   record where a user is");
    Logger::info("  join <user> [channel]            discord_voice_join");
    Logger::info("  listen <user> [window gap max]   discord_voice_listen_turn (ms)");
    Logger::info("  leave <user>                     discord_voice_leave");
    Logger::info("  tools                            print tool definitions");
    Logger::info("  quit");
}

/// Wait up to timeout_ms for stdin to become readable
bool stdin_ready(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    return poll(&pfd, 1, timeout_ms) > 0;
}

void submit(ToolExecutor& executor, const std::string& tool_name,
            const std::string& guild_id, const std::string& user_id,
            const nlohmann::json& params) {
    static std::atomic<int> call_counter{0};

    ToolExecutionRequest request;
    request.tool_name = tool_name;
    request.tool_call_id = "cli-" + std::to_string(++call_counter);
    request.context.guild_id = guild_id;
    request.context.user_id = user_id;
    request.params_json = params.dump();

    executor.execute_async(request, [tool_name](const ToolExecutionResult& res) {
        if (res.result.success) {
            Logger::info("[" + res.tool_call_id + "] " + tool_name + ": " + res.result.content);
        } else {
            auto it = res.result.metadata.find("error_type");
            std::string type = it == res.result.metadata.end() ? "Error" : it->second;
            Logger::warn("[" + res.tool_call_id + "] " + tool_name + " failed (" + type + "): " +
                         res.result.error);
        }
    });
}

} // anonymous namespace

} // namespace guild_voice

int main(int argc, char* argv[]) {
    using namespace guild_voice;

    Logger::initialize(LogLevel::INFO);

    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        LocalVoiceTransport::list_devices();
        Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : "config/config.json";
    Config config = Config::load_from_file(config_path);
    config.apply_env_overrides();

    // Re-initialize with configured level and file
    Logger::shutdown();
    Logger::initialize(Logger::parse_level(config.logging.level), config.logging.file);

    if (!config.voice.enabled) {
        Logger::error("Voice is disabled (set voice.enabled or VOICE_ENABLED=1)");
        Logger::shutdown();
        return 1;
    }
    if (config.voice.allowlist.empty()) {
        Logger::warn("Voice allowlist is empty; every join will be rejected");
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exit_code = 0;
    {
        // Speech backends
        auto openai = std::make_shared<OpenAiAudioClient>(config.speech);
        std::shared_ptr<SpeechToText> stt = openai;
        if (config.speech.provider == "whisper") {
            auto whisper = std::make_shared<WhisperSpeechToText>(config.speech);
            if (!whisper->is_ready()) {
                Logger::error("Whisper model failed to load: " + config.speech.whisper_model_path);
                exit_code = 1;
            }
            stt = whisper;
        } else if (config.speech.provider != "openai") {
            Logger::error("Unknown speech provider: " + config.speech.provider);
            exit_code = 1;
        }

        if (exit_code == 0) {
            auto manager = std::make_shared<VoiceManager>(config.voice, stt, openai);
            auto transport = std::make_shared<LocalVoiceTransport>(
                config.audio, config.voice.pcm_sample_rate, config.voice.pcm_channels);
            auto llm = std::make_shared<LLMClient>(config.llm);

            auto configured = manager->configure(transport, llm);
            if (!configured) {
                Logger::error("Failed to configure voice manager: " + configured.error().message);
                exit_code = 1;
            }

            if (exit_code == 0) {
                manager->start_idle_reaper();

                ToolRegistry registry;
                registry.register_tool(std::make_shared<VoiceJoinTool>(manager));
                registry.register_tool(std::make_shared<VoiceListenTurnTool>(manager));
                registry.register_tool(std::make_shared<VoiceLeaveTool>(manager));
                ToolExecutor executor(&registry, config.tools.max_concurrent);

                std::signal(SIGINT, signal_handler);
                std::signal(SIGTERM, signal_handler);

                std::string guild_id = "0";
                if (!config.voice.allowlist.empty()) {
                    guild_id = std::to_string(config.voice.allowlist.begin()->first);
                }
                Logger::info("guild_voice ready (guild " + guild_id + "). Type 'help' for commands.");

                while (g_running) {
                    if (!stdin_ready(200)) continue;

                    std::string line;
                    if (!std::getline(std::cin, line)) break;
                    utils::trim(line);
                    if (line.empty()) continue;

                    std::istringstream iss(line);
                    std::string cmd;
                    iss >> cmd;

                    if (cmd == "quit" || cmd == "exit") {
                        break;
                    } else if (cmd == "help") {
                        print_help();
                    } else if (cmd == "guild") {
                        std::string id;
                        if (iss >> id) {
                            guild_id = id;
                            Logger::info("Guild set to " + guild_id);
                        }
                    } else if (cmd == "presence") {
                        std::string user, channel;
                        if (!(iss >> user >> channel)) {
                            Logger::warn("usage: presence <user> <channel|none>");
                            continue;
                        }
                        std::optional<std::string> target;
                        if (channel != "none") target = channel;
                        auto updated = manager->update_user_voice_state(guild_id, user, target);
                        if (!updated) {
                            Logger::warn("presence: " + updated.error().message);
                        }
                    } else if (cmd == "join") {
                        std::string user, channel;
                        if (!(iss >> user)) {
                            Logger::warn("usage: join <user> [channel]");
                            continue;
                        }
                        nlohmann::json params = nlohmann::json::object();
                        if (iss >> channel) params["channel_id"] = channel;
                        submit(executor, "discord_voice_join", guild_id, user, params);
                    } else if (cmd == "listen") {
                        std::string user;
                        if (!(iss >> user)) {
                            Logger::warn("usage: listen <user> [window_ms gap_ms max_turn_ms]");
                            continue;
                        }
                        nlohmann::json params = nlohmann::json::object();
                        const char* keys[] = {"listen_window_ms", "chunk_gap_ms", "max_turn_ms"};
                        std::string value;
                        for (const char* key : keys) {
                            if (!(iss >> value)) break;
                            if (auto ms = utils::parse_u64(value)) params[key] = *ms;
                        }
                        submit(executor, "discord_voice_listen_turn", guild_id, user, params);
                    } else if (cmd == "leave") {
                        std::string user;
                        if (!(iss >> user)) {
                            Logger::warn("usage: leave <user>");
                            continue;
                        }
                        submit(executor, "discord_voice_leave", guild_id, user, nlohmann::json::object());
                    } else if (cmd == "tools") {
                        Logger::info(registry.get_tool_definitions_json());
                    } else {
                        Logger::warn("Unknown command: " + cmd);
                    }
                }

                Logger::info("Shutting down...");
                executor.wait_for_completion(config.tools.timeout_ms);
                executor.shutdown();
                manager->stop_idle_reaper();
            }
        }
    }

    curl_global_cleanup();
    Logger::shutdown();
    return exit_code;
}
