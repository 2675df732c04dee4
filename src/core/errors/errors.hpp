#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace Tether {
namespace Core {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised when a wait exceeds its bound. Always recoverable by the caller.
class TimeoutError : public Error {
public:
    TimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
        : Error("waiting for " + operation + " failed: timeout "
                + std::to_string(timeout.count()) + "ms exceeded"),
          operation_(operation),
          timeout_(timeout) {
    }

    const std::string& operation() const {
        return operation_;
    }
    std::chrono::milliseconds timeout() const {
        return timeout_;
    }

private:
    std::string               operation_;
    std::chrono::milliseconds timeout_;
};

// Programming errors: closing the default context, unsupported operations.
class PreconditionError : public Error {
public:
    using Error::Error;
};

class ProtocolError : public Error {
public:
    ProtocolError(const std::string& method, const std::string& message)
        : Error("Protocol error (" + method + "): " + message), method_(method) {
    }

    const std::string& method() const {
        return method_;
    }

private:
    std::string method_;
};

// The lifecycle event stream broke one of its ordering guarantees.
class InternalError : public Error {
public:
    using Error::Error;
};

}  // namespace Core
}  // namespace Tether
