#ifndef PROTOCOL_CODEC_HPP
#define PROTOCOL_CODEC_HPP

#include "Event.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class Transport;

#define PROTOCOL_VERSION "1.5.2"

struct CodecLimits
{
    size_t maxHeaderBytes = 64 * 1024;
    size_t maxDataBytes = 1024 * 1024;
    size_t maxPayloadBytes = 16 * 1024 * 1024;
    // Unknown type tags are a ProtocolError when set, an UnknownEvent otherwise.
    bool strictTypes = true;
};

namespace ProtocolCodec {

// Serializes one event: JSON header line, data bytes, payload bytes.
std::vector<uint8_t> encode(const Event &event);

// Builds an event from an already split frame. Throws ProtocolError.
Event decodeFrame(const std::string &header,
                  const std::string &extraData,
                  std::vector<uint8_t> payload,
                  const CodecLimits &limits);

} // namespace ProtocolCodec

/**
 * Pull-based decoder over a transport: each next() yields one event.
 * Returns std::nullopt when the peer closed the stream between frames.
 */
class EventReader
{
public:
    explicit EventReader(Transport &in, CodecLimits limits = CodecLimits{});

    std::optional<Event> next();

private:
    bool readLine(std::string &line);
    void readExact(size_t len, uint8_t *out);
    size_t fill();

    Transport &in_;
    CodecLimits limits_;
    std::vector<uint8_t> buf_;
    size_t start_ = 0;
    size_t end_ = 0;
};

// Destination for outbound events.
class EventSink
{
public:
    virtual ~EventSink() = default;
    virtual void send(const Event &event) = 0;
};

class EventWriter : public EventSink
{
public:
    explicit EventWriter(Transport &out) : out_(out) {}

    void send(const Event &event) override;

private:
    Transport &out_;
};

#endif // PROTOCOL_CODEC_HPP
