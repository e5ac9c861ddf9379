#ifndef HTTP_BACKENDS_HPP
#define HTTP_BACKENDS_HPP

#include "Backend.hpp"

#include <string>

/**
 * Speech-to-text over an OpenAI compatible transcription endpoint
 * (faster-whisper, whisper.cpp server, ...). Every call uploads the
 * utterance as a 16-bit mono WAV file.
 */
class HttpAsrBackend : public AsrBackend
{
public:
    // Throws BackendInitError if the health probe fails.
    explicit HttpAsrBackend(const BackendConfig &config);
    ~HttpAsrBackend() override;

    std::string transcribe(const std::vector<float> &samples, uint32_t sampleRateHz) override;

private:
    BackendConfig config_;
};

/**
 * Text-to-speech over a Kokoro-FastAPI style /audio/speech endpoint with
 * streamed raw PCM output. Fragments are handed out as they arrive.
 */
class HttpTtsBackend : public TtsBackend
{
public:
    explicit HttpTtsBackend(const BackendConfig &config);
    ~HttpTtsBackend() override;

    std::unique_ptr<SynthesisStream> synthesize(const std::string &text,
                                                const std::string &voice,
                                                float speed) override;

private:
    BackendConfig config_;
};

namespace HttpUtil {

// Minimal RIFF/WAVE container around mono PCM16 samples.
std::vector<uint8_t> wavBytes(const std::vector<int16_t> &samples, uint32_t sampleRateHz);

} // namespace HttpUtil

#endif // HTTP_BACKENDS_HPP
