#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/*
 * ============================================================================
 * ERRORS - Rejections Raised by the Session Core
 * ============================================================================
 *
 * Every rejection is thrown before the aggregate touches its state, so a
 * failed command never leaves a visible trace. The Lobby catches StageError
 * and turns it into an "error" event for the member that sent the command.
 *
 *   NotFound          session / item / suggestion / member id unknown
 *   Forbidden         command not allowed for the member's role
 *   InvalidOrder      reorder payload is not a permutation of the tail
 *   DuplicatePending  proposer already has a pending suggestion
 *   InvalidArgument   payload out of range (empty name, speed <= 0, ...)
 *   FrameTooLarge     an event did not fit in one frame and was not sent
 *   ConnectionLost    transport gone; drives reconnect, never sent as event
 * ============================================================================
 */

enum class ErrorKind {
    NotFound,
    Forbidden,
    InvalidOrder,
    DuplicatePending,
    InvalidArgument,
    FrameTooLarge,
    ConnectionLost
};

inline const char* errorCode(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::Forbidden:
        return "forbidden";
    case ErrorKind::InvalidOrder:
        return "invalid_order";
    case ErrorKind::DuplicatePending:
        return "duplicate_pending";
    case ErrorKind::InvalidArgument:
        return "invalid_argument";
    case ErrorKind::FrameTooLarge:
        return "frame_too_large";
    case ErrorKind::ConnectionLost:
        return "connection_lost";
    }
    return "unknown";
}

class StageError : public std::runtime_error {
public:
    StageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Raised by the codec when a frame body cannot be turned into a command/event.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

#endif // ERRORS_HPP
