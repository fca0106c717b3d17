#include "core/SessionManager.hpp"
#include "core/Logger.hpp"

namespace core {

SessionManager::SessionManager(EngineConfig config, std::shared_ptr<exercise::ReferenceStore> store,
                               voice::VoiceDispatcher* voice)
    : config_(std::move(config)),
      store_(std::move(store)),
      voice_(voice) {
    if (!store_ && config_.comparator.enabled) {
        store_ = std::make_shared<exercise::FileReferenceStore>(config_.comparator.referenceDir);
    }
}

std::shared_ptr<SessionManager::Entry> SessionManager::find(SessionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(handle);
    return it == sessions_.end() ? nullptr : it->second;
}

SessionHandle SessionManager::start(exercise::ExerciseKind kind) {
    SessionHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = nextHandle_++;
    }

    // Reference loading touches the filesystem; keep it outside the registry lock
    auto entry = std::make_shared<Entry>(handle, kind, config_, store_.get());

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.emplace(handle, std::move(entry));
    return handle;
}

FrameResult SessionManager::processFrame(SessionHandle handle, const PoseDetection& detection) {
    return processFrame(handle, detection, Clock::now());
}

FrameResult SessionManager::processFrame(SessionHandle handle, const PoseDetection& detection,
                                         Clock::time_point now) {
    auto entry = find(handle);
    if (!entry) {
        FrameResult result;
        result.error = FrameError::UnknownSession;
        result.feedback = frameErrorMessage(result.error);
        result.timestamp = now;
        return result;
    }

    FrameResult result;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        result = entry->session.processFrame(detection, now);
    }

    if (voice_) {
        for (const auto& text : result.speech) {
            voice_->enqueue(handle, text);
        }
    }
    return result;
}

bool SessionManager::calibrate(SessionHandle handle, const PoseDetection& detection) {
    auto entry = find(handle);
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->session.calibrate(detection);
}

bool SessionManager::setPaused(SessionHandle handle, bool paused) {
    auto entry = find(handle);
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.setPaused(paused);
    Logger::info("Session ", handle, paused ? " paused" : " resumed");
    return true;
}

std::optional<int> SessionManager::end(SessionHandle handle) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(handle);
        if (it == sessions_.end()) return std::nullopt;
        entry = std::move(it->second);
        sessions_.erase(it);
    }

    // Wait for a frame still in flight on another thread
    std::lock_guard<std::mutex> lock(entry->mutex);
    const int reps = entry->session.repCount();
    Logger::info("Session ", handle, " ended with ", reps, " reps");
    return reps;
}

size_t SessionManager::activeSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace core
