#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "voice_types.h"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <optional>
#include <string>
#include <thread>

namespace guild_voice {

class VoiceSession;
class VoiceTransport;
class VoiceReplyOrchestrator;
class SpeechToText;
class TextToSpeech;

/**
 * @brief Effective capture bounds for one listen call
 */
struct CaptureParams {
    Duration listen_window{0};
    Duration chunk_gap{0};
    Duration max_turn{0};
};

/**
 * @brief Resolve per-call overrides against configured defaults
 *
 * Listen window is clamped to [1s, 60s], chunk gap to [100ms, 3s], max
 * turn to [1s, 60s] and then raised to at least the chunk gap.
 */
CaptureParams resolve_capture_params(const VoiceConfig& config, const ListenArgs& args);

/**
 * @brief Voice session registry and join / listen / leave orchestration
 *
 * Constructed unconfigured; configure() binds the transport and the reply
 * orchestrator exactly once. Until then every voice operation fails with
 * NotConfigured. Identifiers arrive as decimal strings from the tool layer
 * and are parsed here.
 *
 * All public methods are safe to call from any thread.
 */
class VoiceManager {
public:
    VoiceManager(const VoiceConfig& config,
                 std::shared_ptr<SpeechToText> stt,
                 std::shared_ptr<TextToSpeech> tts);

    /**
     * @brief Stops the idle reaper if it is running
     */
    ~VoiceManager();

    // Non-copyable
    VoiceManager(const VoiceManager&) = delete;
    VoiceManager& operator=(const VoiceManager&) = delete;

    /**
     * @brief Bind the late collaborators
     * @return InvalidState if already configured or either handle is null
     */
    Result<void> configure(std::shared_ptr<VoiceTransport> transport,
                           std::shared_ptr<VoiceReplyOrchestrator> orchestrator);

    bool is_configured() const;

    /**
     * @brief Record where a user currently is
     * @param channel_id Channel the user is in, nullopt when they left voice
     */
    Result<void> update_user_voice_state(const std::string& guild_id,
                                         const std::string& user_id,
                                         const std::optional<std::string>& channel_id);

    /**
     * @brief Join the requester's channel (or args.channel_id)
     * @return "Joined voice channel <id>"
     */
    Result<std::string> join_for_requester(const std::string& guild_id,
                                           const std::string& requester_user_id,
                                           const JoinArgs& args = {});

    /**
     * @brief Leave the room's voice channel
     *
     * The requester must be in the session's channel. If the transport
     * fails to disconnect the session is kept.
     */
    Result<std::string> leave_for_requester(const std::string& guild_id,
                                            const std::string& requester_user_id);

    /**
     * @brief Capture one turn, transcribe it, generate a reply and speak it
     *
     * Concurrent calls on the same room are serialized around the capture;
     * speech and reply calls run after the listen lock is released.
     *
     * @return Status line containing a shortened transcript
     */
    Result<std::string> listen_and_respond_for_requester(const std::string& guild_id,
                                                         const std::string& requester_user_id,
                                                         const ListenArgs& args = {});

    /**
     * @brief Start the background idle-eviction thread (idempotent)
     */
    void start_idle_reaper();

    /**
     * @brief Stop and join the idle-eviction thread (idempotent)
     */
    void stop_idle_reaper();

    /**
     * @brief Evict sessions idle for at least idle_timeout
     *
     * No-op when idle_timeout is zero. Transport failures are logged and
     * the session is removed anyway.
     *
     * @return Number of sessions evicted
     */
    size_t reap_idle_sessions();

    bool has_session(SnowflakeId guild_id) const;
    size_t session_count() const;

private:
    const VoiceConfig config_;
    std::shared_ptr<SpeechToText> stt_;
    std::shared_ptr<TextToSpeech> tts_;

    mutable std::shared_mutex handles_mutex_;
    std::shared_ptr<VoiceTransport> transport_;
    std::shared_ptr<VoiceReplyOrchestrator> orchestrator_;

    mutable std::shared_mutex sessions_mutex_;
    std::map<SnowflakeId, std::shared_ptr<VoiceSession>> sessions_;

    mutable std::shared_mutex presence_mutex_;
    std::map<std::pair<SnowflakeId, SnowflakeId>, SnowflakeId> user_channels_;

    // Idle reaper
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    bool reaper_stop_ = false;
    std::thread reaper_thread_;

    void reaper_loop();

    Result<std::shared_ptr<VoiceTransport>> transport() const;
    Result<std::shared_ptr<VoiceReplyOrchestrator>> orchestrator() const;
    std::shared_ptr<VoiceSession> find_session(SnowflakeId guild_id) const;
    std::optional<SnowflakeId> user_channel(SnowflakeId guild_id, SnowflakeId user_id) const;

    Result<void> ensure_allowlisted(SnowflakeId guild_id, SnowflakeId channel_id) const;
    Result<void> ensure_requester_in_channel(SnowflakeId guild_id,
                                             SnowflakeId user_id,
                                             SnowflakeId expected_channel_id) const;
};

} // namespace guild_voice
