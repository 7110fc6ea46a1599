#pragma once

#include <stdexcept>
#include <string>

namespace sluice {

class SluiceError : public std::runtime_error {
public:
    explicit SluiceError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or malformed input (empty query, bad mini-language syntax, blocked script pattern)
class ValidationError : public SluiceError {
public:
    explicit ValidationError(const std::string& message) : SluiceError(message) {}
};

class NotFoundError : public SluiceError {
public:
    explicit NotFoundError(const std::string& message) : SluiceError(message) {}
};

// Backend unavailable or required configuration missing
class ConfigurationError : public SluiceError {
public:
    explicit ConfigurationError(const std::string& message) : SluiceError(message) {}
};

class TimeoutError : public SluiceError {
public:
    explicit TimeoutError(const std::string& message) : SluiceError(message) {}
};

// Another worker holds the channel lock. Not a failure: the job is offered again later.
class LockUnavailableError : public SluiceError {
public:
    explicit LockUnavailableError(const std::string& channel_key)
        : SluiceError("Lock unavailable for channel " + channel_key),
          channel_key_(channel_key) {}

    const std::string& channel_key() const { return channel_key_; }

private:
    std::string channel_key_;
};

} // namespace sluice
