#ifndef TABWRIGHT_CORE_ERRORS_HPP
#define TABWRIGHT_CORE_ERRORS_HPP

#include <tabwright/core/json.hpp>
#include <stdexcept>
#include <cstdint>
#include <string>

namespace tabwright {

// ============================================================================
// Channel errors
// ============================================================================

// Base for everything raised by ChannelClient::call
class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& what) : std::runtime_error(what) {}
};

// Endpoint unreachable, handshake rejected or connection dropped
class TransportError : public ChannelError {
public:
    explicit TransportError(const std::string& what) : ChannelError(what) {}
};

// Well-formed response carrying an "error" object
class ProtocolError : public ChannelError {
public:
    ProtocolError(const std::string& method, const Json& error);

    const std::string& method() const { return method_; }
    int64_t code() const { return code_; }
    const std::string& remote_message() const { return remote_message_; }
    const Json& payload() const { return payload_; }

private:
    std::string method_;
    int64_t code_;
    std::string remote_message_;
    Json payload_;
};

// Request still pending (or issued) after the channel was closed
class ChannelClosed : public ChannelError {
public:
    explicit ChannelClosed(const std::string& what) : ChannelError(what) {}
};

// ============================================================================
// Extraction / session errors
// ============================================================================

class ExtractionTimeout : public std::runtime_error {
public:
    ExtractionTimeout(int index, long long waited_ms, const std::string& last_status);

    int index() const { return index_; }
    const std::string& last_status() const { return last_status_; }

private:
    int index_;
    std::string last_status_;
};

// Shared stop flag observed while work was still in progress
class SessionStopped : public std::runtime_error {
public:
    explicit SessionStopped(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tabwright

#endif // TABWRIGHT_CORE_ERRORS_HPP
