#pragma once

#include <stdexcept>
#include <string>

namespace texq {

// Failure taxonomy. Compile outcomes (error, timeout, canceled) are job
// statuses, not exceptions.
enum class ErrorKind {
    Validation,
    InfrastructureUnavailable,
    Broker,
    StateConflict,
    Config
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad engine name, oversized source, malformed path or id. Rejected before enqueue.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::Validation, message) {}
};

// Broker, container runtime or compiler image missing; submission is refused.
class InfrastructureUnavailable : public Error {
public:
    explicit InfrastructureUnavailable(const std::string& message)
        : Error(ErrorKind::InfrastructureUnavailable, message) {}
};

// A single broker round trip failed. Never retried inside the pipeline.
class BrokerError : public Error {
public:
    explicit BrokerError(const std::string& message)
        : Error(ErrorKind::Broker, message) {}
};

class StateConflict : public Error {
public:
    explicit StateConflict(const std::string& message)
        : Error(ErrorKind::StateConflict, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::Config, message) {}
};

} // namespace texq
