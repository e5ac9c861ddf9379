#ifndef BACKEND_HPP
#define BACKEND_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Settings a backend provider is constructed from. Two handles with the same
// kind and key() share one backend instance.
struct BackendConfig
{
    std::string kind;
    std::string url;
    std::string healthUrl;
    std::string model;
    std::string language;
    std::string responseFormat;
    int timeoutMs = 0;
    uint32_t sampleRate = 0;

    std::string key() const;
};

class AsrBackend
{
public:
    virtual ~AsrBackend() = default;

    // Blocking. samples are mono, normalized to [-1, 1).
    // Throws BackendInvocationError.
    virtual std::string transcribe(const std::vector<float> &samples, uint32_t sampleRateHz) = 0;
};

// Lazily produced PCM16 mono fragments of one synthesis call.
class SynthesisStream
{
public:
    virtual ~SynthesisStream() = default;

    // Blocks until the next fragment is available. Returns false once the
    // stream is exhausted. May throw BackendInvocationError mid-stream.
    virtual bool next(std::vector<uint8_t> &fragment) = 0;
};

class TtsBackend
{
public:
    virtual ~TtsBackend() = default;

    virtual std::unique_ptr<SynthesisStream> synthesize(const std::string &text,
                                                        const std::string &voice,
                                                        float speed) = 0;
};

#endif // BACKEND_HPP
