#include "types.hpp"

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Configuration:        return "ConfigurationError";
    case ErrorKind::Connection:           return "ConnectionError";
    case ErrorKind::Authentication:       return "AuthenticationError";
    case ErrorKind::Timeout:              return "TimeoutError";
    case ErrorKind::UnsupportedOperation: return "UnsupportedOperationError";
    case ErrorKind::UnrecognizedOutput:   return "UnrecognizedOutputError";
    case ErrorKind::CommandFailed:        return "CommandError";
    case ErrorKind::Cancelled:            return "CancelledError";
    }
    return "Error";
}

bool is_session_fatal(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnsupportedOperation:
    case ErrorKind::CommandFailed:
        return false;
    default:
        return true;
    }
}

BackupError::BackupError(ErrorKind kind, const std::string& message,
                         const std::string& command)
    : std::runtime_error(message), kind_(kind), command_(command) {}
