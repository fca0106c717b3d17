#pragma once

#include "core/CoachSession.hpp"
#include "core/EngineConfig.hpp"
#include "exercise/ReferenceStore.hpp"
#include "voice/VoiceDispatcher.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace core {

/**
 * Control surface for any number of concurrent sessions.
 *
 * All methods are thread-safe. Frames for different sessions are processed
 * in parallel; frames for one session are serialised. Sessions share nothing
 * mutable except the voice dispatcher, which receives every spoken message
 * tagged with its session handle.
 */
class SessionManager {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param store reference source; nullptr creates a FileReferenceStore on
     *        config.comparator.referenceDir
     * @param voice optional dispatcher for spoken feedback (not owned)
     */
    explicit SessionManager(EngineConfig config,
                            std::shared_ptr<exercise::ReferenceStore> store = nullptr,
                            voice::VoiceDispatcher* voice = nullptr);

    SessionHandle start(exercise::ExerciseKind kind);

    FrameResult processFrame(SessionHandle handle, const PoseDetection& detection);
    FrameResult processFrame(SessionHandle handle, const PoseDetection& detection, Clock::time_point now);

    /**
     * @return false for an unknown handle or when the shoulders are not visible
     */
    bool calibrate(SessionHandle handle, const PoseDetection& detection);

    /**
     * @return false for an unknown handle
     */
    bool setPaused(SessionHandle handle, bool paused);

    /**
     * Remove the session.
     * @return final rep count, or std::nullopt for an unknown handle
     */
    std::optional<int> end(SessionHandle handle);

    [[nodiscard]] size_t activeSessions() const;
    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    struct Entry {
        std::mutex mutex;
        CoachSession session;

        template<typename... Args>
        explicit Entry(Args&&... args) : session(std::forward<Args>(args)...) {}
    };

    EngineConfig config_;
    std::shared_ptr<exercise::ReferenceStore> store_;
    voice::VoiceDispatcher* voice_;

    mutable std::mutex mutex_;
    std::map<SessionHandle, std::shared_ptr<Entry>> sessions_;
    SessionHandle nextHandle_ = 1;

    std::shared_ptr<Entry> find(SessionHandle handle) const;
};

} // namespace core
