#ifndef TEST_UTIL_HPP
#define TEST_UTIL_HPP

#include "AudioFormat.hpp"
#include "Backend.hpp"
#include "Errors.hpp"
#include "ProtocolCodec.hpp"
#include "Resampler.hpp"
#include "Transport.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

// Serves canned bytes in slices of at most maxRead and records writes.
class MemoryTransport : public Transport
{
public:
    explicit MemoryTransport(std::vector<uint8_t> input = {}, size_t maxRead = 4096)
        : input_(std::move(input)), maxRead_(maxRead)
    {
    }

    explicit MemoryTransport(const std::string &input, size_t maxRead = 4096)
        : input_(input.begin(), input.end()), maxRead_(maxRead)
    {
    }

    size_t read(uint8_t *buf, size_t len) override
    {
        size_t n = std::min({len, maxRead_, input_.size() - pos_});
        std::memcpy(buf, input_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    void write(const uint8_t *data, size_t len) override
    {
        if (failWrites)
            throw TransportError("peer went away");
        output.insert(output.end(), data, data + len);
    }

    std::vector<uint8_t> output;
    bool failWrites = false;

private:
    std::vector<uint8_t> input_;
    size_t maxRead_;
    size_t pos_ = 0;
};

// Keeps every outbound event for inspection.
class RecordingSink : public EventSink
{
public:
    void send(const Event &event) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }

    template <typename T>
    std::vector<T> all() const
    {
        std::vector<T> out;
        for (const Event &e : events)
            if (const T *v = std::get_if<T>(&e))
                out.push_back(*v);
        return out;
    }

    std::vector<std::string> types() const
    {
        std::vector<std::string> out;
        for (const Event &e : events)
            out.push_back(eventTypeName(e));
        return out;
    }

    std::vector<Event> events;
    std::mutex mutex;
};

inline std::vector<uint8_t> pcmBytes(const std::vector<int16_t> &samples)
{
    std::vector<uint8_t> out;
    AudioConvert::pcm16ToBytes(samples, out);
    return out;
}

inline std::vector<uint8_t> patternBytes(size_t len, uint8_t seed = 0)
{
    std::vector<uint8_t> out(len);
    for (size_t i = 0; i < len; i++)
        out[i] = static_cast<uint8_t>(seed + i * 7);
    return out;
}

// Records the calls it gets and returns a fixed text or throws.
class StubAsr : public AsrBackend
{
public:
    std::string transcribe(const std::vector<float> &samples, uint32_t sampleRateHz) override
    {
        calls++;
        lastSamples = samples;
        lastRate = sampleRateHz;
        if (fail)
            throw BackendInvocationError("model crashed");
        return text;
    }

    std::string text = "hello world";
    bool fail = false;
    std::atomic<int> calls{0};
    std::vector<float> lastSamples;
    uint32_t lastRate = 0;
};

// Hands out the given fragments, then throws if failAfter is set.
class ScriptedStream : public SynthesisStream
{
public:
    ScriptedStream(std::vector<std::vector<uint8_t>> fragments, bool failAfter)
        : fragments_(std::move(fragments)), failAfter_(failAfter)
    {
    }

    bool next(std::vector<uint8_t> &fragment) override
    {
        if (pos_ < fragments_.size())
        {
            fragment = fragments_[pos_++];
            return true;
        }
        if (failAfter_)
            throw BackendInvocationError("synthesis backend dropped the stream");
        return false;
    }

private:
    std::vector<std::vector<uint8_t>> fragments_;
    bool failAfter_;
    size_t pos_ = 0;
};

class StubTts : public TtsBackend
{
public:
    std::unique_ptr<SynthesisStream> synthesize(const std::string &text,
                                                const std::string &voice,
                                                float speed) override
    {
        calls++;
        lastText = text;
        lastVoice = voice;
        lastSpeed = speed;
        return std::make_unique<ScriptedStream>(fragments, failAfter);
    }

    std::vector<std::vector<uint8_t>> fragments;
    bool failAfter = false;
    std::atomic<int> calls{0};
    std::string lastText;
    std::string lastVoice;
    float lastSpeed = 0.0f;
};

// Repeats or drops samples to hit the output length; counts invocations.
class FakeResampler : public Resampler
{
public:
    const char *name() const override { return "fake"; }

    std::vector<int16_t> process(const std::vector<int16_t> &in, uint32_t inRateHz,
                                 uint32_t outRateHz) override
    {
        calls++;
        lastIn = inRateHz;
        lastOut = outRateHz;
        size_t outLen = static_cast<size_t>((uint64_t)in.size() * outRateHz / inRateHz);
        std::vector<int16_t> out(outLen);
        for (size_t i = 0; i < outLen; i++)
            out[i] = in[(uint64_t)i * inRateHz / outRateHz];
        return out;
    }

    int calls = 0;
    uint32_t lastIn = 0;
    uint32_t lastOut = 0;
};

#endif // TEST_UTIL_HPP
