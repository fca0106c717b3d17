#include "voice/VoiceDispatcher.hpp"
#include "core/Logger.hpp"

namespace voice {

VoiceDispatcher::VoiceDispatcher(std::unique_ptr<SpeechBackend> backend, VoiceConfig config,
                                 std::shared_ptr<core::TimeSource> time)
    : _backend(std::move(backend)),
      _config(std::move(config)),
      _time(std::move(time)),
      _queue(_config.queueSize),
      _running(false) {
    if (!_backend) {
        _backend = std::make_unique<LogSpeechBackend>();
    }
    if (!_time) {
        _time = std::make_shared<core::SteadyTimeSource>();
    }
}

VoiceDispatcher::~VoiceDispatcher() {
    stop();
}

void VoiceDispatcher::start() {
    if (_running) return;
    _running = true;
    _thread = std::thread(&VoiceDispatcher::loop, this);
    core::Logger::info("VoiceDispatcher started. Backend: ", _backend->name());
}

void VoiceDispatcher::stop() {
    if (!_running.exchange(false)) return;

    SpeechRequest sentinel;
    sentinel.stop = true;
    _queue.pushUrgent(std::move(sentinel));
    // Producers that passed the running check now fail in tryPush
    _queue.close();

    if (_thread.joinable()) {
        _thread.join();
    }
    core::Logger::info("VoiceDispatcher stopped. Spoken: ", _spoken.load(), ", dropped: ", _dropped.load());
}

bool VoiceDispatcher::enqueue(core::SessionHandle sessionId, std::string text) {
    if (!_running) {
        core::Logger::debug("VoiceDispatcher: not running, discarding \"", text, "\"");
        return false;
    }

    SpeechRequest request;
    request.sessionId = sessionId;
    request.text = std::move(text);
    request.enqueuedAt = _time->now();

    if (!_queue.tryPush(std::move(request))) {
        core::Logger::debug("VoiceDispatcher: queue full, request from session ", sessionId, " rejected");
        return false;
    }
    return true;
}

void VoiceDispatcher::loop() {
    while (true) {
        auto request = _queue.pop();
        if (!request) break;

        if (request->stop) {
            // pop() returns nullopt only once stop() closed the queue and it is empty
            while (auto rest = _queue.pop()) {
                if (!rest->stop) handle(*rest);
            }
            break;
        }

        handle(*request);
    }
}

bool VoiceDispatcher::isStale(const SpeechRequest& request, Clock::time_point now) const {
    const std::chrono::duration<float> age = now - request.enqueuedAt;
    return age.count() > _config.maxStalenessSeconds;
}

void VoiceDispatcher::handle(const SpeechRequest& request) {
    // Minimum gap between utterances
    if (_lastSpokenAt) {
        const auto gap = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<float>(_config.minIntervalSeconds));
        const auto earliest = *_lastSpokenAt + gap;
        if (_time->now() < earliest) {
            _time->sleepUntil(earliest);
        }
    }

    if (isStale(request, _time->now())) {
        _dropped++;
        core::Logger::debug("VoiceDispatcher: dropping stale request from session ", request.sessionId,
                            ": \"", request.text, "\"");
        return;
    }

    if (_backend->speak(request.text)) {
        _spoken++;
    }
    _lastSpokenAt = _time->now();
}

std::unique_ptr<SpeechBackend> makeSpeechBackend(const VoiceConfig& config) {
    if (config.backend == "command") {
        return std::make_unique<CommandSpeechBackend>(config.command, config.args);
    }
    if (config.backend != "log") {
        core::Logger::warn("VoiceDispatcher: unknown backend '", config.backend, "', using log");
    }
    return std::make_unique<LogSpeechBackend>();
}

} // namespace voice
