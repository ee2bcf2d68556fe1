#include "scplite/ScpTypes.hpp"

namespace scplite {

const char* errorKindName(ScpErrorKind kind) {
    switch (kind) {
    case ScpErrorKind::None:
        return "ok";
    case ScpErrorKind::Transport:
        return "transport error";
    case ScpErrorKind::ProtocolViolation:
        return "protocol violation";
    case ScpErrorKind::RemoteWarning:
        return "remote warning";
    case ScpErrorKind::RemoteError:
        return "remote error";
    case ScpErrorKind::IO:
        return "i/o error";
    }
    return "unknown";
}

std::string ScpError::describe() const {
    if (message.empty())
        return errorKindName(kind);
    return std::string(errorKindName(kind)) + ": " + message;
}

} // namespace scplite
