#pragma once
#include <stdexcept>
#include <string>

namespace mcp_echo {

class EchoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A line that cannot be decoded into a request.
class ParseError : public EchoError {
public:
    using EchoError::EchoError;
};

/// A caller-visible failure carrying a JSON-RPC error code.
class ProtocolError : public EchoError {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : EchoError(msg), code(code) {}
};

class TransportError : public EchoError {
public:
    using EchoError::EchoError;
};

/// An input line exceeded the transport's size limit and was discarded.
/// The stream itself is still usable.
class FrameTooLargeError : public TransportError {
public:
    using TransportError::TransportError;
};

namespace error {
    constexpr int InternalError = -32603;
} // namespace error

} // namespace mcp_echo
