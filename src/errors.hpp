#pragma once

#include <stdexcept>
#include <string>

// Base of every error raised by the archive pipeline.
class CcsiftError : public std::runtime_error {
public:
    explicit CcsiftError(const std::string& msg) : std::runtime_error(msg) {}
};

// Unreachable host, connection reset, timeout or cancellation.
class NetworkError : public CcsiftError {
public:
    explicit NetworkError(const std::string& msg) : CcsiftError(msg) {}
};

// Wrong status code or a missing required header.
class ProtocolError : public CcsiftError {
public:
    explicit ProtocolError(const std::string& msg) : CcsiftError(msg) {}
};

// No record/HTTP boundary, malformed status line, unparsable JSON.
class ParseError : public CcsiftError {
public:
    explicit ParseError(const std::string& msg) : CcsiftError(msg) {}
};

class DecodeError : public CcsiftError {
public:
    explicit DecodeError(const std::string& msg) : CcsiftError(msg) {}
};

// A compressed or uncompressed size cap was exceeded.
class CapacityError : public CcsiftError {
public:
    explicit CapacityError(const std::string& msg) : CcsiftError(msg) {}
};
