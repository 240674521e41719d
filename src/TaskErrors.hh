#pragma once

#include <stdexcept>
#include <string>

using namespace std;

enum class ErrorKind
{
    Validation,
    TransientProtocol,
    FatalProtocol,
    Cancellation,
    InternalInvariant
};

inline const char *errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Validation:
        return "validation";

    case ErrorKind::TransientProtocol:
        return "transient_protocol";

    case ErrorKind::FatalProtocol:
        return "fatal_protocol";

    case ErrorKind::Cancellation:
        return "cancellation";

    case ErrorKind::InternalInvariant:
        return "internal_invariant";
    }

    return "unknown";
}

// Base of every error the task layer reports; the kind travels with the Job outcome
class TaskError : public runtime_error
{
public:
    TaskError(ErrorKind kind, const string &message) : runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};

// Bad input, rejected before any Job exists
class ValidationError : public TaskError
{
public:
    explicit ValidationError(const string &message) : TaskError(ErrorKind::Validation, message) {}
};

// Network hiccup or flood wait; retried with backoff up to the configured bound
class TransientProtocolError : public TaskError
{
public:
    explicit TransientProtocolError(const string &message) : TaskError(ErrorKind::TransientProtocol, message) {}
};

// Auth failure, ban, invalid peer: never retried
class FatalProtocolError : public TaskError
{
public:
    explicit FatalProtocolError(const string &message) : TaskError(ErrorKind::FatalProtocol, message) {}
};

// Thrown from a checkpoint once cancellation was requested
class CancelledError : public TaskError
{
public:
    explicit CancelledError(const string &message = "cancelled") : TaskError(ErrorKind::Cancellation, message) {}
};

// Programming defect (duplicate id, illegal transition)
class InvariantError : public TaskError
{
public:
    explicit InvariantError(const string &message) : TaskError(ErrorKind::InternalInvariant, message) {}
};
