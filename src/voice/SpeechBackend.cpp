#include "voice/SpeechBackend.hpp"
#include "core/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace voice {

CommandSpeechBackend::CommandSpeechBackend(std::string command, std::vector<std::string> args)
    : command_(std::move(command)), args_(std::move(args)) {
}

bool CommandSpeechBackend::speak(const std::string& text) {
    // argv: command, args..., text, nullptr
    std::vector<std::string> storage;
    storage.reserve(args_.size() + 2);
    storage.push_back(command_);
    storage.insert(storage.end(), args_.begin(), args_.end());
    storage.push_back(text);

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, command_.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        if (!failing_) {
            core::Logger::warn("CommandSpeechBackend: cannot start '", command_, "': ", std::strerror(rc));
            failing_ = true;
        }
        return false;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            core::Logger::warn("CommandSpeechBackend: waitpid failed: ", std::strerror(errno));
            return false;
        }
    }

    const bool ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    if (!ok && !failing_) {
        core::Logger::warn("CommandSpeechBackend: '", command_, "' exited with status ", status);
    }
    if (ok && failing_) {
        core::Logger::info("CommandSpeechBackend: '", command_, "' recovered");
    }
    failing_ = !ok;
    return ok;
}

bool LogSpeechBackend::speak(const std::string& text) {
    core::Logger::info("Voice: \"", text, "\"");
    return true;
}

} // namespace voice
