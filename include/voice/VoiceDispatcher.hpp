#pragma once

#include "core/MessageQueue.hpp"
#include "core/TimeSource.hpp"
#include "core/Types.hpp"
#include "voice/SpeechBackend.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace voice {

struct VoiceConfig {
    bool enabled = true;
    std::string backend = "log";            // "command" or "log"
    std::string command = "espeak-ng";
    std::vector<std::string> args;
    size_t queueSize = core::VOICE_QUEUE_SIZE;
    float minIntervalSeconds = core::VOICE_MIN_INTERVAL_S;    // Gap between two utterances
    float maxStalenessSeconds = core::VOICE_MAX_STALENESS_S;  // Older requests are dropped unspoken
};

struct SpeechRequest {
    core::SessionHandle sessionId = 0;
    std::string text;
    std::chrono::steady_clock::time_point enqueuedAt;
    bool stop = false;   // Stop sentinel: drain until the queue is closed and empty, then exit
};

/**
 * Owns the speech backend and speaks requests one at a time on its own thread.
 *
 * enqueue() never blocks the caller. The worker throttles itself so that a
 * backlog cannot turn into a burst of late, out-of-context speech.
 * Requests from several sessions are serialised onto the one device.
 */
class VoiceDispatcher {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param time clock for throttling and staleness; nullptr uses the steady clock
     */
    VoiceDispatcher(std::unique_ptr<SpeechBackend> backend, VoiceConfig config = {},
                    std::shared_ptr<core::TimeSource> time = nullptr);
    ~VoiceDispatcher();

    VoiceDispatcher(const VoiceDispatcher&) = delete;
    VoiceDispatcher& operator=(const VoiceDispatcher&) = delete;

    void start();

    /**
     * Send the stop sentinel and close the queue, so every accepted request
     * is either spoken or dropped as stale before the worker is joined
     */
    void stop();

    /**
     * Queue an utterance. Returns false if the queue is full or the dispatcher is stopped.
     */
    bool enqueue(core::SessionHandle sessionId, std::string text);

    [[nodiscard]] bool running() const { return _running; }
    [[nodiscard]] uint64_t spokenCount() const { return _spoken; }
    [[nodiscard]] uint64_t droppedCount() const { return _dropped; }
    [[nodiscard]] const VoiceConfig& config() const { return _config; }

private:
    void loop();
    void handle(const SpeechRequest& request);
    bool isStale(const SpeechRequest& request, Clock::time_point now) const;

    std::unique_ptr<SpeechBackend> _backend;
    VoiceConfig _config;
    std::shared_ptr<core::TimeSource> _time;
    core::MessageQueue<SpeechRequest> _queue;

    std::atomic<bool> _running;
    std::thread _thread;

    // Worker-only state
    std::optional<Clock::time_point> _lastSpokenAt;

    std::atomic<uint64_t> _spoken{0};
    std::atomic<uint64_t> _dropped{0};
};

/**
 * Backend selected by config: "command" -> CommandSpeechBackend, anything else -> LogSpeechBackend
 */
std::unique_ptr<SpeechBackend> makeSpeechBackend(const VoiceConfig& config);

} // namespace voice
