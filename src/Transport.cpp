#include "Transport.hpp"

#include "Errors.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

size_t SocketTransport::read(uint8_t *buf, size_t len)
{
    for (;;)
    {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        throw TransportError(std::string("recv failed: ") + strerror(errno));
    }
}

void SocketTransport::write(const uint8_t *data, size_t len)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw TransportError(std::string("send failed: ") + strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}
