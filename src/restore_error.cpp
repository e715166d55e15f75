#include "restore_error.hpp"
#include <format>

const char* toString(RestoreErrorKind kind) {
    switch (kind) {
        case RestoreErrorKind::ToolNotFound:
            return "ToolNotFound";
        case RestoreErrorKind::SpawnFailed:
            return "SpawnFailed";
        case RestoreErrorKind::ProcessFailed:
            return "ProcessFailed";
        case RestoreErrorKind::StreamWriteFailed:
            return "StreamWriteFailed";
        case RestoreErrorKind::InvalidConfiguration:
            return "InvalidConfiguration";
        case RestoreErrorKind::InputUnavailable:
            return "InputUnavailable";
        case RestoreErrorKind::TunnelUnreachable:
            return "TunnelUnreachable";
    }
    return "Unknown";
}

std::string RestoreError::describe() const {
    return std::format("{}: {}", toString(kind), message);
}
