#pragma once

// ============================================================
// errors.hpp -- Exceptions raised by remote operations and jobs
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <stdexcept>
#include <string>

// Error answered by the remote endpoint (MT_ERROR)
class RemoteError : public std::runtime_error {
public:
    RemoteError(ErrorCode code, u32 value, const std::string& msg)
        : std::runtime_error(std::string(error_code_str(code)) + ": " + msg)
        , code_(code), value_(value) {}

    ErrorCode code()  const { return code_; }
    u32       value() const { return value_; }

private:
    ErrorCode code_;
    u32       value_;
};

// Rate-limit signal: the endpoint asks the caller to wait before retrying
class RateLimitError : public RemoteError {
public:
    RateLimitError(u32 wait_seconds, const std::string& msg)
        : RemoteError(ErrorCode::FLOOD_WAIT, wait_seconds, msg) {}

    u32 wait_seconds() const { return value(); }
};

// Rate-limit retries used up; carries the last signal's suggested wait
class RetryExhaustedError : public std::runtime_error {
public:
    RetryExhaustedError(int attempts, u32 last_wait_seconds, const std::string& msg)
        : std::runtime_error(msg)
        , attempts_(attempts), last_wait_seconds_(last_wait_seconds) {}

    int attempts() const { return attempts_; }
    u32 last_wait_seconds() const { return last_wait_seconds_; }

private:
    int attempts_;
    u32 last_wait_seconds_;
};

// Raised at a blocking point once the job's CancelToken fired
class TransferCancelled : public std::runtime_error {
public:
    TransferCancelled() : std::runtime_error("transfer cancelled") {}
};

// Map an MT_ERROR payload onto the matching exception type
[[noreturn]] inline void throw_remote_error(ErrorCode code, u32 value, const std::string& msg) {
    if (code == ErrorCode::FLOOD_WAIT) throw RateLimitError(value, msg);
    throw RemoteError(code, value, msg);
}
