#ifndef EVENT_HPP
#define EVENT_HPP

#include "AudioFormat.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

class CapabilityDescriptor;

struct Describe {};

struct InfoResponse
{
    // Set on the server side. A decoded info event only carries the raw data.
    std::shared_ptr<const CapabilityDescriptor> capabilities;
    std::string data;
};

struct TranscribeRequest
{
    std::string name;
    std::string language;
};

struct Transcript
{
    std::string text;
};

struct SynthesizeRequest
{
    std::string text;
    std::string voice;
    std::optional<float> speed;
    std::string responseFormat;
};

struct AudioStart
{
    AudioFormat format;
};

struct AudioChunk
{
    // Only required on the first chunk of a stream.
    std::optional<AudioFormat> format;
    std::vector<uint8_t> audio;
};

struct AudioStop {};

struct Ping
{
    std::string text;
};

struct Pong
{
    std::string text;
};

// Produced only when the decoder runs in lenient mode.
struct UnknownEvent
{
    std::string type;
};

using Event = std::variant<Describe,
                           InfoResponse,
                           TranscribeRequest,
                           Transcript,
                           SynthesizeRequest,
                           AudioStart,
                           AudioChunk,
                           AudioStop,
                           Ping,
                           Pong,
                           UnknownEvent>;

// Wire type tag of an event, e.g. "audio-chunk".
const char *eventTypeName(const Event &event);

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

#endif // EVENT_HPP
