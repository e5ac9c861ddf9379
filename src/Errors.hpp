#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Malformed wire data. Ends the connection it was read from.
class ProtocolError : public std::runtime_error
{
public:
    explicit ProtocolError(const std::string &what) : std::runtime_error(what) {}
};

// The peer went away or a socket call failed.
class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const std::string &what) : std::runtime_error(what) {}
};

class BackendError : public std::runtime_error
{
public:
    explicit BackendError(const std::string &what) : std::runtime_error(what) {}
};

// Constructing a backend failed. The handle stays failed until restart.
class BackendInitError : public BackendError
{
public:
    explicit BackendInitError(const std::string &what) : BackendError(what) {}
};

// A transcribe/synthesize call failed. The session recovers locally.
class BackendInvocationError : public BackendError
{
public:
    explicit BackendInvocationError(const std::string &what) : BackendError(what) {}
};

#endif // ERRORS_HPP
