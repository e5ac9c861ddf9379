#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>

/**
 * Byte stream underneath the event codec.
 *
 * read() returns 0 on orderly end of stream. Both calls throw
 * TransportError when the stream is broken.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    virtual size_t read(uint8_t *buf, size_t len) = 0;
    virtual void write(const uint8_t *data, size_t len) = 0;
};

// Connected stream socket. Does not own the descriptor.
class SocketTransport : public Transport
{
public:
    explicit SocketTransport(int fd) : fd_(fd) {}

    size_t read(uint8_t *buf, size_t len) override;
    void write(const uint8_t *data, size_t len) override;

    int fd() const { return fd_; }

private:
    int fd_;
    std::mutex write_mutex_;
};

#endif // TRANSPORT_HPP
