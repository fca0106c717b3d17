#include "core/Types.hpp"

namespace core {

const char* frameErrorMessage(FrameError error) {
    switch (error) {
        case FrameError::None:                   return "";
        case FrameError::NoDetection:            return "No person detected";
        case FrameError::InsufficientVisibility: return "Please fully enter the frame";
        case FrameError::Paused:                 return "Session paused";
        case FrameError::UnknownSession:         return "No active session";
        default: return "Unknown error";
    }
}

} // namespace core
