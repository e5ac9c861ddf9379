#include "ProtocolCodec.hpp"

#include "CapabilityDescriptor.hpp"
#include "Errors.hpp"
#include "JsonUtil.hpp"
#include "Logger.hpp"
#include "Transport.hpp"

#include <cmath>
#include <algorithm>
#include <cstdint>
#include <cstring>

#define MODULE "CODEC"

#define MAX_SAMPLE_WIDTH_BYTES 4

using namespace JsonUtil;

const char *eventTypeName(const Event &event)
{
    return std::visit(overloaded{
        [](const Describe &) { return "describe"; },
        [](const InfoResponse &) { return "info"; },
        [](const TranscribeRequest &) { return "transcribe"; },
        [](const Transcript &) { return "transcript"; },
        [](const SynthesizeRequest &) { return "synthesize"; },
        [](const AudioStart &) { return "audio-start"; },
        [](const AudioChunk &) { return "audio-chunk"; },
        [](const AudioStop &) { return "audio-stop"; },
        [](const Ping &) { return "ping"; },
        [](const Pong &) { return "pong"; },
        [](const UnknownEvent &e) { return e.type.c_str(); },
    }, event);
}

namespace {

void add_format(std::string &out, bool &sep, const AudioFormat &f)
{
    add_key(out, sep, "rate"); add_num(out, f.sampleRateHz);
    add_key(out, sep, "width"); add_num(out, f.width());
    add_key(out, sep, "channels"); add_num(out, f.channels);
}

// Returns the data object text, empty if the event carries no data.
std::string encodeData(const Event &event)
{
    std::string out;
    bool sep = false;
    std::visit(overloaded{
        [&](const Describe &) {},
        [&](const InfoResponse &e) {
            out = e.capabilities ? e.capabilities->toJson() : e.data;
        },
        [&](const TranscribeRequest &e) {
            out = "{";
            if (!e.name.empty()) { add_key(out, sep, "name"); add_str(out, e.name); }
            if (!e.language.empty()) { add_key(out, sep, "language"); add_str(out, e.language); }
            out += "}";
        },
        [&](const Transcript &e) {
            out = "{"; add_key(out, sep, "text"); add_str(out, e.text); out += "}";
        },
        [&](const SynthesizeRequest &e) {
            out = "{";
            add_key(out, sep, "text"); add_str(out, e.text);
            if (!e.voice.empty()) {
                add_key(out, sep, "voice", "{"); bool s2 = false;
                add_key(out, s2, "name"); add_str(out, e.voice);
                out += "}";
            }
            if (e.speed) { add_key(out, sep, "speed"); add_float(out, *e.speed); }
            if (!e.responseFormat.empty()) { add_key(out, sep, "response_format"); add_str(out, e.responseFormat); }
            out += "}";
        },
        [&](const AudioStart &e) {
            out = "{"; add_format(out, sep, e.format); out += "}";
        },
        [&](const AudioChunk &e) {
            if (e.format) { out = "{"; add_format(out, sep, *e.format); out += "}"; }
        },
        [&](const AudioStop &) {},
        [&](const Ping &e) {
            if (!e.text.empty()) { out = "{"; add_key(out, sep, "text"); add_str(out, e.text); out += "}"; }
        },
        [&](const Pong &e) {
            if (!e.text.empty()) { out = "{"; add_key(out, sep, "text"); add_str(out, e.text); out += "}"; }
        },
        [&](const UnknownEvent &) {},
    }, event);
    return out;
}

// Looks a data field up in the extra data first, then in the inline data.
struct DataView
{
    const JsonValue *extra;
    const JsonValue *inlined;

    const JsonValue *get(const char *key) const
    {
        if (const JsonValue *v = member(extra, key))
            return v;
        return member(inlined, key);
    }

    std::string str(const char *key, const std::string &def = "") const
    {
        const JsonValue *v = get(key);
        return (v && v->type == JSON_STRING && v->value.string) ? v->value.string : def;
    }

    std::optional<double> num(const char *key) const
    {
        const JsonValue *v = get(key);
        if (v && v->type == JSON_NUMBER)
            return v->value.number;
        return std::nullopt;
    }
};

size_t lengthField(const JsonValue *header, const char *key, size_t limit)
{
    const JsonValue *v = member(header, key);
    if (!v || v->type == JSON_NULL)
        return 0;
    if (v->type != JSON_NUMBER || v->value.number < 0 || std::floor(v->value.number) != v->value.number)
        throw ProtocolError(std::string("invalid ") + key);
    if (v->value.number > static_cast<double>(limit))
        throw ProtocolError(std::string(key) + " " + std::to_string((long long) v->value.number)
                            + " exceeds limit " + std::to_string(limit));
    return static_cast<size_t>(v->value.number);
}

// Audio format fields are non-negative integers up to limit; 0 leaves the default.
std::optional<uint32_t> formatField(const DataView &d, const char *key, uint32_t limit)
{
    auto v = d.num(key);
    if (!v)
        return std::nullopt;
    if (!std::isfinite(*v) || *v < 0 || std::floor(*v) != *v || *v > static_cast<double>(limit))
        throw ProtocolError(std::string("invalid audio ") + key);
    return static_cast<uint32_t>(*v);
}

std::optional<AudioFormat> formatFrom(const DataView &d)
{
    auto rate = formatField(d, "rate", UINT32_MAX);
    auto width = formatField(d, "width", MAX_SAMPLE_WIDTH_BYTES);
    auto channels = formatField(d, "channels", UINT8_MAX);
    if (!rate && !width && !channels)
        return std::nullopt;

    AudioFormat f;
    if (rate && *rate > 0) f.sampleRateHz = *rate;
    if (width && *width > 0) f.bitsPerSample = static_cast<uint8_t>(*width * 8);
    if (channels && *channels > 0) f.channels = static_cast<uint8_t>(*channels);
    return f;
}

} // namespace

namespace ProtocolCodec {

std::vector<uint8_t> encode(const Event &event)
{
    std::string data = encodeData(event);
    const std::vector<uint8_t> *payload = nullptr;
    if (auto *chunk = std::get_if<AudioChunk>(&event))
        payload = &chunk->audio;

    std::string header = "{";
    bool sep = false;
    add_key(header, sep, "type"); add_str(header, eventTypeName(event));
    add_key(header, sep, "version"); add_str(header, PROTOCOL_VERSION);
    if (!data.empty()) { add_key(header, sep, "data_length"); add_num(header, data.size()); }
    if (payload) { add_key(header, sep, "payload_length"); add_num(header, payload->size()); }
    header += "}\n";

    std::vector<uint8_t> out;
    out.reserve(header.size() + data.size() + (payload ? payload->size() : 0));
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), data.begin(), data.end());
    if (payload)
        out.insert(out.end(), payload->begin(), payload->end());
    return out;
}

Event decodeFrame(const std::string &header, const std::string &extraData,
                  std::vector<uint8_t> payload, const CodecLimits &limits)
{
    JsonPtr hdr = parse(header);
    if (!isObject(hdr.get()))
        throw ProtocolError("header is not a JSON object");

    std::string type = getString(hdr.get(), "type");
    if (type.empty())
        throw ProtocolError("header has no type");

    JsonPtr extra;
    if (!extraData.empty())
    {
        extra = parse(extraData);
        if (!isObject(extra.get()))
            throw ProtocolError("data of '" + type + "' is not a JSON object");
    }

    const JsonValue *inlined = member(hdr.get(), "data");
    if (inlined && inlined->type != JSON_OBJECT && inlined->type != JSON_NULL)
        throw ProtocolError("inline data of '" + type + "' is not a JSON object");

    DataView d{extra.get(), inlined};

    if (type == "describe")
        return Describe{};
    if (type == "info")
        return InfoResponse{nullptr, extraData.empty() ? header : extraData};
    if (type == "transcribe")
        return TranscribeRequest{d.str("name"), d.str("language")};
    if (type == "transcript")
        return Transcript{d.str("text")};
    if (type == "synthesize")
    {
        SynthesizeRequest req;
        req.text = d.str("text");
        if (const JsonValue *voice = d.get("voice"))
        {
            if (voice->type == JSON_OBJECT)
                req.voice = getString(voice, "name");
            else if (voice->type == JSON_STRING && voice->value.string)
                req.voice = voice->value.string;
        }
        if (auto speed = d.num("speed"))
            req.speed = static_cast<float>(*speed);
        req.responseFormat = d.str("response_format");
        return req;
    }
    if (type == "audio-start")
        return AudioStart{formatFrom(d).value_or(AudioFormat{})};
    if (type == "audio-chunk")
        return AudioChunk{formatFrom(d), std::move(payload)};
    if (type == "audio-stop")
        return AudioStop{};
    if (type == "ping")
        return Ping{d.str("text")};
    if (type == "pong")
        return Pong{d.str("text")};

    if (limits.strictTypes)
        throw ProtocolError("unknown event type '" + type + "'");
    return UnknownEvent{type};
}

} // namespace ProtocolCodec

EventReader::EventReader(Transport &in, CodecLimits limits)
    : in_(in)
    , limits_(limits)
    , buf_(8192)
{
}

size_t EventReader::fill()
{
    if (start_ > 0)
    {
        std::memmove(buf_.data(), buf_.data() + start_, end_ - start_);
        end_ -= start_;
        start_ = 0;
    }
    if (end_ == buf_.size())
        buf_.resize(buf_.size() * 2);

    size_t n = in_.read(buf_.data() + end_, buf_.size() - end_);
    end_ += n;
    return n;
}

bool EventReader::readLine(std::string &line)
{
    size_t scanned = 0;
    for (;;)
    {
        const uint8_t *begin = buf_.data() + start_;
        const void *nl = std::memchr(begin + scanned, '\n', end_ - start_ - scanned);
        if (nl)
        {
            size_t len = static_cast<const uint8_t *>(nl) - begin;
            line.assign(reinterpret_cast<const char *>(begin), len);
            start_ += len + 1;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return true;
        }

        scanned = end_ - start_;
        if (scanned > limits_.maxHeaderBytes)
            throw ProtocolError("header exceeds " + std::to_string(limits_.maxHeaderBytes) + " bytes");

        if (fill() == 0)
        {
            if (end_ == start_)
                return false;
            throw ProtocolError("truncated header");
        }
    }
}

void EventReader::readExact(size_t len, uint8_t *out)
{
    size_t got = 0;
    while (got < len)
    {
        if (start_ == end_ && fill() == 0)
            throw ProtocolError("stream ended inside a frame");
        size_t take = std::min(len - got, end_ - start_);
        std::memcpy(out + got, buf_.data() + start_, take);
        start_ += take;
        got += take;
    }
}

std::optional<Event> EventReader::next()
{
    std::string header;
    do
    {
        if (!readLine(header))
            return std::nullopt;
    } while (header.empty());

    JsonPtr hdr = parse(header);
    if (!isObject(hdr.get()))
        throw ProtocolError("header is not a JSON object");

    size_t dataLength = lengthField(hdr.get(), "data_length", limits_.maxDataBytes);
    size_t payloadLength = lengthField(hdr.get(), "payload_length", limits_.maxPayloadBytes);

    std::string extra(dataLength, '\0');
    if (dataLength > 0)
        readExact(dataLength, reinterpret_cast<uint8_t *>(extra.data()));

    std::vector<uint8_t> payload(payloadLength);
    if (payloadLength > 0)
        readExact(payloadLength, payload.data());

    Event event = ProtocolCodec::decodeFrame(header, extra, std::move(payload), limits_);
    LOG_DDEBUG("recv " << eventTypeName(event) << " data=" << dataLength << " payload=" << payloadLength);
    return event;
}

void EventWriter::send(const Event &event)
{
    std::vector<uint8_t> bytes = ProtocolCodec::encode(event);
    LOG_DDEBUG("send " << eventTypeName(event) << " (" << bytes.size() << " bytes)");
    out_.write(bytes.data(), bytes.size());
}
