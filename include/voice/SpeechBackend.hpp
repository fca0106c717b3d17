#pragma once

#include <string>
#include <vector>

namespace voice {

/**
 * A device that can say one utterance at a time.
 * speak() blocks until the utterance finished; false means it could not be spoken.
 * Only the VoiceDispatcher worker calls it.
 */
class SpeechBackend {
public:
    virtual ~SpeechBackend() = default;

    virtual bool speak(const std::string& text) = 0;
    virtual const char* name() const = 0;
};

/**
 * Runs an external TTS program per utterance: <command> <args...> <text>
 */
class CommandSpeechBackend : public SpeechBackend {
public:
    explicit CommandSpeechBackend(std::string command = "espeak-ng", std::vector<std::string> args = {});

    bool speak(const std::string& text) override;
    const char* name() const override { return "command"; }

    [[nodiscard]] const std::string& command() const { return command_; }

private:
    std::string command_;
    std::vector<std::string> args_;
    bool failing_ = false;   // Suppresses repeated warnings while the command keeps failing
};

/**
 * Writes utterances to the log. Used when no speech device is configured.
 */
class LogSpeechBackend : public SpeechBackend {
public:
    bool speak(const std::string& text) override;
    const char* name() const override { return "log"; }
};

} // namespace voice
