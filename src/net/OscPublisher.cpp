#include "net/OscPublisher.hpp"
#include "core/Logger.hpp"

namespace net {

using core::Logger;

OscPublisher::OscPublisher(const core::OscConfig& config)
    : _config(config), _queue(config.queueSize), _running(false) {
}

OscPublisher::~OscPublisher() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

bool OscPublisher::start() {
    if (_running) return true;

    if (!_loAddress) {
        _loAddress = lo_address_new(_config.host.c_str(), _config.port.c_str());
    }
    if (!_loAddress) {
        Logger::error("OscPublisher: Failed to create LO address for ", _config.host, ":", _config.port);
        return false;
    }

    _running = true;
    _thread = std::thread(&OscPublisher::loop, this);
    Logger::info("OscPublisher started. Target: ", _config.host, ":", _config.port);
    return true;
}

void OscPublisher::stop() {
    if (!_running.exchange(false)) return;
    if (_thread.joinable()) {
        _thread.join();
    }
    Logger::info("OscPublisher stopped. Sent: ", _sent.load(), ", dropped: ", _dropped.load());
}

bool OscPublisher::publish(const core::FrameResult& result) {
    if (!_running) return false;
    if (!_queue.tryPush(result)) {
        _dropped++;
        return false;
    }
    return true;
}

void OscPublisher::loop() {
    while (_running) {
        auto result = _queue.popFor(std::chrono::milliseconds(10));
        if (!result) continue;

        auto now = std::chrono::steady_clock::now();
        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(now - result->timestamp).count();

        if (latency > _config.maxLatencyMs) {
            // Stale results are worse than none for a live display
            _dropped++;
            continue;
        }

        send(*result);
    }
}

void OscPublisher::sendMessage(const char* path, lo_message msg) {
    if (lo_send_message(_loAddress, path, msg) == -1) {
        Logger::error("OscPublisher: Failed to send ", path, ": ", lo_address_errstr(_loAddress));
    }
    lo_message_free(msg);
}

void OscPublisher::send(const core::FrameResult& result) {
    if (!_loAddress) return;

    if (!result.success) {
        lo_message msg = lo_message_new();
        lo_message_add_int32(msg, static_cast<int32_t>(result.error));
        lo_message_add_string(msg, result.errorMessage());
        sendMessage("/coach/error", msg);
        return;
    }

    lo_message reps = lo_message_new();
    lo_message_add_int32(reps, result.repCount);
    lo_message_add_string(reps, result.exercise.c_str());
    sendMessage("/coach/reps", reps);

    if (result.repCompleted) {
        lo_message completed = lo_message_new();
        lo_message_add_int32(completed, result.repCount);
        sendMessage("/coach/rep_completed", completed);
    }

    lo_message feedback = lo_message_new();
    lo_message_add_string(feedback, result.feedback.c_str());
    sendMessage("/coach/feedback", feedback);

    if (!result.angles.empty()) {
        lo_message angles = lo_message_new();
        result.angles.forEach([&angles](math::JointAngle joint, float degrees) {
            lo_message_add_string(angles, math::jointAngleName(joint));
            lo_message_add_float(angles, degrees);
        });
        sendMessage("/coach/angles", angles);
    }

    _sent++;
}

} // namespace net
