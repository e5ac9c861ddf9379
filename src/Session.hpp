#ifndef SESSION_HPP
#define SESSION_HPP

#include "AudioFrameBuffer.hpp"
#include "BackendHandle.hpp"
#include "Event.hpp"

#include <cstdint>
#include <memory>
#include <string>

class CapabilityDescriptor;
class EventSink;
class Resampler;
class WorkerPool;

struct SessionSettings
{
    uint32_t asrSampleRate = DEFAULT_ASR_SAMPLE_RATE;
    AudioFormat ttsFormat{24000, 16, 1};
    size_t chunkSamples = 1024;
    std::string defaultVoice;
    float defaultSpeed = 1.0f;
    unsigned int streamQueueFrames = 32;
};

// Process-wide collaborators shared by every session.
struct SessionContext
{
    std::shared_ptr<const CapabilityDescriptor> capabilities;
    std::shared_ptr<AsrHandle> asr;         // null when transcription is disabled
    std::shared_ptr<TtsHandle> tts;         // null when synthesis is disabled
    std::shared_ptr<Resampler> resampler;   // null when no resampler is available
    WorkerPool *workers = nullptr;
    SessionSettings settings;
};

/**
 * Protocol state machine of one client connection.
 *
 * Events are handled strictly in arrival order on the caller's thread;
 * backend calls are handed to the worker pool and awaited. A backend
 * failure never reaches the caller: transcription answers with an empty
 * transcript, synthesis closes the audio stream it already opened.
 * Only transport errors (TransportError) propagate out of handle().
 */
class Session
{
public:
    enum class State
    {
        Idle,
        Describing,
        Collecting,
        Finalizing,
        Streaming
    };

    Session(EventSink &out, const SessionContext &ctx, std::string peer = "");

    void handle(const Event &event);

    State state() const { return state_; }
    static const char *stateName(State state);

    const AudioFrameBuffer &buffer() const { return buffer_; }
    uint32_t requestsHandled() const { return requests_; }
    uint32_t backendFailures() const { return failures_; }

private:
    void onDescribe();
    void onTranscribe(const TranscribeRequest &req);
    void onAudioChunk(const AudioChunk &chunk);
    void onAudioStop();
    void onSynthesize(const SynthesizeRequest &req);
    void ignore(const Event &event);

    std::string transcribeCollected();
    bool streamSynthesis(const std::string &text, const std::string &voice, float speed,
                         uint64_t &samplesSent);

    EventSink &out_;
    const SessionContext &ctx_;
    std::string peer_;
    State state_ = State::Idle;
    AudioFrameBuffer buffer_;
    std::string language_;
    uint32_t requests_ = 0;
    uint32_t failures_ = 0;
};

#endif // SESSION_HPP
