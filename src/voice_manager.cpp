#include "voice_manager.h"
#include "voice_session.h"
#include "voice_transport.h"
#include "audio_sink.h"
#include "speech_services.h"
#include "reply_orchestrator.h"
#include "wav.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <vector>

namespace guild_voice {

namespace {

Result<SnowflakeId> parse_id(const std::string& raw, const char* field_name) {
    auto value = utils::parse_u64(raw);
    if (!value) {
        return make_error(ErrorType::InvalidIdentifier,
                          std::string("invalid ") + field_name + " `" + raw + "`");
    }
    return *value;
}

uint64_t clamp_ms(uint64_t value, int lo, int hi) {
    return std::clamp<uint64_t>(value, static_cast<uint64_t>(lo), static_cast<uint64_t>(hi));
}

Error stage_error(ErrorType type, const std::string& stage, const Error& cause) {
    return Error(type, stage + ": " + cause.message);
}

} // anonymous namespace

CaptureParams resolve_capture_params(const VoiceConfig& config, const ListenArgs& args) {
    uint64_t listen_window_ms = clamp_ms(
        args.listen_window_ms.value_or(static_cast<uint64_t>(config.default_listen_window.count())),
        MIN_LISTEN_WINDOW_MS, MAX_LISTEN_WINDOW_MS);
    uint64_t chunk_gap_ms = clamp_ms(
        args.chunk_gap_ms.value_or(static_cast<uint64_t>(config.default_chunk_gap.count())),
        MIN_CHUNK_GAP_MS, MAX_CHUNK_GAP_MS);
    uint64_t max_turn_ms = clamp_ms(
        args.max_turn_ms.value_or(static_cast<uint64_t>(config.default_max_turn.count())),
        MIN_MAX_TURN_MS, MAX_MAX_TURN_MS);
    max_turn_ms = std::max(max_turn_ms, chunk_gap_ms);

    CaptureParams params;
    params.listen_window = Duration(listen_window_ms);
    params.chunk_gap = Duration(chunk_gap_ms);
    params.max_turn = Duration(max_turn_ms);
    return params;
}

VoiceManager::VoiceManager(const VoiceConfig& config,
                           std::shared_ptr<SpeechToText> stt,
                           std::shared_ptr<TextToSpeech> tts)
    : config_(config), stt_(std::move(stt)), tts_(std::move(tts)) {
    LOG_VOICE("Manager created (allowlist entries: " + std::to_string(config_.allowlist.size()) +
              ", idle timeout: " + std::to_string(config_.idle_timeout.count()) + "s)");
}

VoiceManager::~VoiceManager() {
    stop_idle_reaper();
}

Result<void> VoiceManager::configure(std::shared_ptr<VoiceTransport> transport,
                                     std::shared_ptr<VoiceReplyOrchestrator> orchestrator) {
    if (!transport || !orchestrator) {
        return make_error(ErrorType::InvalidState, "transport and orchestrator are required");
    }

    std::unique_lock<std::shared_mutex> lock(handles_mutex_);
    if (transport_) {
        return make_error(ErrorType::InvalidState, "voice manager is already configured");
    }
    transport_ = std::move(transport);
    orchestrator_ = std::move(orchestrator);
    LOG_VOICE("Manager configured");
    return Result<void>();
}

bool VoiceManager::is_configured() const {
    std::shared_lock<std::shared_mutex> lock(handles_mutex_);
    return transport_ != nullptr;
}

Result<void> VoiceManager::update_user_voice_state(const std::string& guild_id_raw,
                                                   const std::string& user_id_raw,
                                                   const std::optional<std::string>& channel_id_raw) {
    auto guild_id = parse_id(guild_id_raw, "guild_id");
    if (!guild_id) return guild_id.error();
    auto user_id = parse_id(user_id_raw, "user_id");
    if (!user_id) return user_id.error();

    std::optional<SnowflakeId> channel_id;
    if (channel_id_raw) {
        auto parsed = parse_id(*channel_id_raw, "channel_id");
        if (!parsed) return parsed.error();
        channel_id = parsed.value();
    }

    std::unique_lock<std::shared_mutex> lock(presence_mutex_);
    auto key = std::make_pair(guild_id.value(), user_id.value());
    if (channel_id) {
        user_channels_[key] = *channel_id;
    } else {
        user_channels_.erase(key);
    }
    return Result<void>();
}

Result<std::string> VoiceManager::join_for_requester(const std::string& guild_id_raw,
                                                     const std::string& requester_user_id_raw,
                                                     const JoinArgs& args) {
    auto guild_id = parse_id(guild_id_raw, "guild_id");
    if (!guild_id) return guild_id.error();
    auto requester_id = parse_id(requester_user_id_raw, "requester_user_id");
    if (!requester_id) return requester_id.error();

    SnowflakeId channel_id = 0;
    if (args.channel_id) {
        auto parsed = parse_id(*args.channel_id, "channel_id");
        if (!parsed) return parsed.error();
        channel_id = parsed.value();
    } else {
        auto current = user_channel(guild_id.value(), requester_id.value());
        if (!current) {
            return make_error(ErrorType::NotInVoice,
                              "requesting user is not currently in a voice channel");
        }
        channel_id = *current;
    }

    auto allowed = ensure_allowlisted(guild_id.value(), channel_id);
    if (!allowed) return allowed.error();

    auto transport_result = transport();
    if (!transport_result) return transport_result.error();

    auto call = transport_result.value()->join(guild_id.value(), channel_id);
    if (!call) {
        return make_error(ErrorType::TransportError,
                          "failed to join voice channel " + std::to_string(channel_id) +
                          " in guild " + std::to_string(guild_id.value()) + ": " +
                          call.error().message);
    }

    auto session = std::make_shared<VoiceSession>(channel_id);
    // Replaces any sink left over from a previous session in this room
    call.value()->set_audio_sink(std::make_shared<SessionAudioSink>(session));
    session->touch();

    {
        std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
        sessions_[guild_id.value()] = session;
    }

    LOG_VOICE("Joined guild " + std::to_string(guild_id.value()) +
              " channel " + std::to_string(channel_id));
    return "Joined voice channel " + std::to_string(channel_id);
}

Result<std::string> VoiceManager::leave_for_requester(const std::string& guild_id_raw,
                                                      const std::string& requester_user_id_raw) {
    auto guild_id = parse_id(guild_id_raw, "guild_id");
    if (!guild_id) return guild_id.error();
    auto requester_id = parse_id(requester_user_id_raw, "requester_user_id");
    if (!requester_id) return requester_id.error();

    auto session = find_session(guild_id.value());
    if (!session) {
        return make_error(ErrorType::NoActiveSession, "no active voice session for this guild");
    }

    auto collocated = ensure_requester_in_channel(guild_id.value(), requester_id.value(),
                                                  session->channel_id());
    if (!collocated) return collocated.error();

    auto transport_result = transport();
    if (!transport_result) return transport_result.error();

    auto left = transport_result.value()->leave(guild_id.value());
    if (!left) {
        return make_error(ErrorType::TransportError,
                          "failed to leave voice session in guild " +
                          std::to_string(guild_id.value()) + ": " + left.error().message);
    }

    {
        std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
        sessions_.erase(guild_id.value());
    }

    LOG_VOICE("Left guild " + std::to_string(guild_id.value()));
    return std::string("Left the voice channel.");
}

Result<std::string> VoiceManager::listen_and_respond_for_requester(const std::string& guild_id_raw,
                                                                   const std::string& requester_user_id_raw,
                                                                   const ListenArgs& args) {
    auto guild_id = parse_id(guild_id_raw, "guild_id");
    if (!guild_id) return guild_id.error();
    auto requester_id = parse_id(requester_user_id_raw, "requester_user_id");
    if (!requester_id) return requester_id.error();

    auto session = find_session(guild_id.value());
    if (!session) {
        return make_error(ErrorType::NoActiveSession, "bot is not connected to voice in this guild");
    }

    const SnowflakeId channel_id = session->channel_id();
    auto collocated = ensure_requester_in_channel(guild_id.value(), requester_id.value(), channel_id);
    if (!collocated) return collocated.error();
    auto allowed = ensure_allowlisted(guild_id.value(), channel_id);
    if (!allowed) return allowed.error();

    auto transport_result = transport();
    if (!transport_result) return transport_result.error();
    auto orchestrator_result = orchestrator();
    if (!orchestrator_result) return orchestrator_result.error();

    CaptureParams params = resolve_capture_params(config_, args);
    LOG_SESSION("listen guild " + std::to_string(guild_id.value()) +
                " window=" + std::to_string(params.listen_window.count()) +
                "ms gap=" + std::to_string(params.chunk_gap.count()) +
                "ms max_turn=" + std::to_string(params.max_turn.count()) + "ms");

    // A listen counts as activity before any speech arrives
    session->touch();
    Result<CapturedTurn> captured = make_error(ErrorType::Unknown, "capture not started");
    {
        auto listen_lock = session->lock_for_listen();
        session->clear_chunks();
        captured = session->capture_turn(params.listen_window, params.chunk_gap, params.max_turn);
    }
    session->touch();

    if (!captured) {
        return captured.error().with_context("failed to capture a voice turn");
    }
    const CapturedTurn& turn = captured.value();
    LOG_VOICE("Captured turn: " + std::to_string(turn.samples.size()) + " samples from " +
              std::to_string(turn.speakers.size()) + " speaker(s)");

    WavBytes wav = encode_wav(turn.samples,
                              static_cast<uint16_t>(config_.pcm_channels),
                              static_cast<uint32_t>(config_.pcm_sample_rate));

    auto transcript_result = stt_->transcribe(wav);
    if (!transcript_result) {
        return stage_error(ErrorType::SttFailed, "STT transcription failed", transcript_result.error());
    }
    std::string transcript = utils::trim_copy(transcript_result.value());
    if (transcript.empty()) {
        return make_error(ErrorType::EmptyTranscript, "transcription returned empty text");
    }
    LOG_STT("Transcript: " + transcript);

    std::vector<std::string> labels;
    for (const auto& speaker : turn.speakers) {
        if (!speaker.empty()) labels.push_back(speaker);
    }
    std::string content = transcript;
    if (!labels.empty()) {
        content = "[speakers:" + utils::join(labels, ",") + "] " + transcript;
    }

    MessageContext message;
    message.timestamp_ms = epoch_ms();
    message.message_id = "voice-turn-" + std::to_string(message.timestamp_ms);
    message.user_id = "voice:" + std::to_string(guild_id.value()) + ":" + std::to_string(channel_id);
    message.guild_id = std::to_string(guild_id.value());
    message.channel_id = std::to_string(channel_id);
    message.content = content;

    auto reply = orchestrator_result.value()->handle_voice_transcript(message);
    if (!reply) {
        return stage_error(ErrorType::ReplyGenerationFailed,
                           "failed to generate assistant reply for voice turn", reply.error());
    }

    std::string reply_for_tts = utils::clamp_tts_input(reply.value(), config_.max_tts_input_chars);
    auto audio = tts_->synthesize(reply_for_tts);
    if (!audio) {
        return stage_error(ErrorType::TtsFailed, "TTS synthesis failed", audio.error());
    }

    auto call = transport_result.value()->get_call(guild_id.value());
    if (!call) {
        return make_error(ErrorType::NotConnected, "bot is no longer connected to voice");
    }
    auto played = call->play(audio.value());
    if (!played) {
        return stage_error(ErrorType::TransportError, "failed to play reply audio", played.error());
    }
    session->touch();

    return "Processed voice turn and replied in voice. Transcript: " +
           utils::truncate_for_tool_result(transcript, MAX_TOOL_RESULT_TRANSCRIPT_CHARS);
}

void VoiceManager::start_idle_reaper() {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    if (reaper_thread_.joinable()) {
        return;
    }
    reaper_stop_ = false;
    reaper_thread_ = std::thread(&VoiceManager::reaper_loop, this);
    LOG_VOICE("Idle reaper started (interval " + std::to_string(config_.reaper_interval.count()) + "ms)");
}

void VoiceManager::stop_idle_reaper() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(reaper_mutex_);
        if (!reaper_thread_.joinable()) {
            return;
        }
        reaper_stop_ = true;
        worker = std::move(reaper_thread_);
    }
    reaper_cv_.notify_all();
    worker.join();
    LOG_VOICE("Idle reaper stopped");
}

void VoiceManager::reaper_loop() {
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (!reaper_stop_) {
        if (reaper_cv_.wait_for(lock, config_.reaper_interval, [this] { return reaper_stop_; })) {
            break;
        }
        lock.unlock();
        reap_idle_sessions();
        lock.lock();
    }
}

size_t VoiceManager::reap_idle_sessions() {
    if (config_.idle_timeout.count() == 0) {
        return 0;
    }

    std::vector<std::pair<SnowflakeId, std::shared_ptr<VoiceSession>>> stale;
    {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
        for (const auto& [guild_id, session] : sessions_) {
            if (session->elapsed_since_last_activity() >= config_.idle_timeout) {
                stale.emplace_back(guild_id, session);
            }
        }
    }

    if (stale.empty()) {
        return 0;
    }

    std::shared_ptr<VoiceTransport> transport_handle;
    {
        std::shared_lock<std::shared_mutex> lock(handles_mutex_);
        transport_handle = transport_;
    }

    // Only the session seen by the scan may be evicted; a join or listen in
    // between replaces or refreshes it.
    auto still_idle = [this](SnowflakeId guild_id, const std::shared_ptr<VoiceSession>& session) {
        auto it = sessions_.find(guild_id);
        return it != sessions_.end() && it->second == session &&
               session->elapsed_since_last_activity() >= config_.idle_timeout;
    };

    size_t evicted = 0;
    for (const auto& [guild_id, session] : stale) {
        {
            std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
            if (!still_idle(guild_id, session)) {
                continue;
            }
        }

        if (transport_handle) {
            auto left = transport_handle->leave(guild_id);
            if (!left) {
                LOG_WARN("[Voice] Failed leaving idle voice session in guild " +
                         std::to_string(guild_id) + ": " + left.error().message);
            }
        }

        {
            std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
            if (!still_idle(guild_id, session)) {
                continue;
            }
            sessions_.erase(guild_id);
        }
        ++evicted;
        LOG_VOICE("Idle session removed for guild " + std::to_string(guild_id));
    }
    return evicted;
}

bool VoiceManager::has_session(SnowflakeId guild_id) const {
    return find_session(guild_id) != nullptr;
}

size_t VoiceManager::session_count() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.size();
}

Result<std::shared_ptr<VoiceTransport>> VoiceManager::transport() const {
    std::shared_lock<std::shared_mutex> lock(handles_mutex_);
    if (!transport_) {
        return make_error(ErrorType::NotConfigured, "voice transport is not configured");
    }
    return transport_;
}

Result<std::shared_ptr<VoiceReplyOrchestrator>> VoiceManager::orchestrator() const {
    std::shared_lock<std::shared_mutex> lock(handles_mutex_);
    if (!orchestrator_) {
        return make_error(ErrorType::NotConfigured, "voice orchestrator is not configured");
    }
    return orchestrator_;
}

std::shared_ptr<VoiceSession> VoiceManager::find_session(SnowflakeId guild_id) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(guild_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<SnowflakeId> VoiceManager::user_channel(SnowflakeId guild_id, SnowflakeId user_id) const {
    std::shared_lock<std::shared_mutex> lock(presence_mutex_);
    auto it = user_channels_.find(std::make_pair(guild_id, user_id));
    if (it == user_channels_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> VoiceManager::ensure_allowlisted(SnowflakeId guild_id, SnowflakeId channel_id) const {
    if (config_.allowlist.empty()) {
        return make_error(ErrorType::ChannelNotAllowed,
                          "voice allowlist is empty; no channel is currently permitted");
    }
    if (config_.allowlist.count(std::make_pair(guild_id, channel_id)) == 0) {
        return make_error(ErrorType::ChannelNotAllowed, "voice channel is not in configured allowlist");
    }
    return Result<void>();
}

Result<void> VoiceManager::ensure_requester_in_channel(SnowflakeId guild_id,
                                                       SnowflakeId user_id,
                                                       SnowflakeId expected_channel_id) const {
    auto current = user_channel(guild_id, user_id);
    if (!current) {
        return make_error(ErrorType::RequesterNotCollocated, "requesting user is not currently in voice");
    }
    if (*current != expected_channel_id) {
        return make_error(ErrorType::RequesterNotCollocated,
                          "requesting user must be in the same voice channel as the bot");
    }
    return Result<void>();
}

} // namespace guild_voice
