#pragma once

#include "core/CoachSession.hpp"
#include "core/EngineConfig.hpp"
#include "core/MessageQueue.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <lo/lo.h>

namespace net {

/**
 * Publishes frame results over OSC (liblo) from its own thread.
 *
 * Addresses:
 *   /coach/reps           i s    total reps, exercise name
 *   /coach/rep_completed  i      total reps (completion frames only)
 *   /coach/feedback       s      screen text
 *   /coach/angles         (s f)* name / degrees for every measured angle
 *   /coach/error          i s    FrameError code and message
 *
 * Results older than the latency limit are dropped instead of sent late.
 */
class OscPublisher {
public:
    explicit OscPublisher(const core::OscConfig& config);
    ~OscPublisher();

    OscPublisher(const OscPublisher&) = delete;
    OscPublisher& operator=(const OscPublisher&) = delete;

    /**
     * @return false if the target address could not be created
     */
    bool start();
    void stop();

    /**
     * Queue a result; never blocks. Returns false if the queue is full.
     */
    bool publish(const core::FrameResult& result);

    [[nodiscard]] bool running() const { return _running; }
    [[nodiscard]] uint64_t sentCount() const { return _sent; }
    [[nodiscard]] uint64_t droppedCount() const { return _dropped; }

private:
    void loop();
    void send(const core::FrameResult& result);
    void sendMessage(const char* path, lo_message msg);

    core::OscConfig _config;
    core::MessageQueue<core::FrameResult> _queue;

    lo_address _loAddress = nullptr;

    std::atomic<bool> _running;
    std::thread _thread;

    std::atomic<uint64_t> _sent{0};
    std::atomic<uint64_t> _dropped{0};
};

} // namespace net
