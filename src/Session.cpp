#include "Session.hpp"

#include "AudioFormat.hpp"
#include "CapabilityDescriptor.hpp"
#include "ChunkReframer.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "MsgChannel.hpp"
#include "ProtocolCodec.hpp"
#include "Resampler.hpp"
#include "WorkerPool.hpp"

#include <algorithm>
#include <chrono>

#define MODULE "SESSION"

#define MIN_SPEED 0.5f
#define MAX_SPEED 2.0f

namespace {

using Clock = std::chrono::steady_clock;

double msSince(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

// One message from the synthesis worker to the session thread.
struct SynthesisItem
{
    enum Kind
    {
        Data,
        End,
        Failed
    };

    Kind kind = Data;
    std::vector<uint8_t> bytes;
    std::string error;
};

using SynthesisChannel = MsgChannel<SynthesisItem>;

// Closes the channel when the consuming side leaves, so a blocked producer
// gives up instead of waiting for a reader that is gone.
struct ChannelCloser
{
    std::shared_ptr<SynthesisChannel> channel;
    ~ChannelCloser() { channel->close(); }
};

void produceSynthesis(std::shared_ptr<TtsHandle> tts,
                      std::shared_ptr<SynthesisChannel> channel,
                      const std::string &text,
                      const std::string &voice,
                      float speed)
{
    try
    {
        std::unique_ptr<SynthesisStream> stream = tts->get().synthesize(text, voice, speed);
        std::vector<uint8_t> fragment;
        while (stream->next(fragment))
        {
            if (fragment.empty())
                continue;

            SynthesisItem item;
            item.bytes = std::move(fragment);
            fragment.clear();
            if (!channel->writeWait(std::move(item)))
            {
                LOG_DEBUG("Consumer went away, abandoning synthesis");
                return;
            }
        }
        channel->writeWait(SynthesisItem{SynthesisItem::End, {}, {}});
    }
    catch (const std::exception &e)
    {
        channel->writeWait(SynthesisItem{SynthesisItem::Failed, {}, e.what()});
    }
    catch (...)
    {
        channel->writeWait(SynthesisItem{SynthesisItem::Failed, {}, "unknown exception"});
    }
}

} // namespace

Session::Session(EventSink &out, const SessionContext &ctx, std::string peer)
    : out_(out), ctx_(ctx), peer_(std::move(peer))
{
}

const char *Session::stateName(State state)
{
    switch (state)
    {
    case State::Idle:
        return "idle";
    case State::Describing:
        return "describing";
    case State::Collecting:
        return "collecting";
    case State::Finalizing:
        return "finalizing";
    case State::Streaming:
        return "streaming";
    }
    return "unknown";
}

void Session::handle(const Event &event)
{
    std::visit(overloaded{
                   [this](const Describe &) { onDescribe(); },
                   [this](const TranscribeRequest &req) { onTranscribe(req); },
                   [this](const AudioChunk &chunk) { onAudioChunk(chunk); },
                   [this](const AudioStop &) { onAudioStop(); },
                   [this](const SynthesizeRequest &req) { onSynthesize(req); },
                   [this](const Ping &ping) { out_.send(Pong{ping.text}); },
                   [this, &event](const auto &) { ignore(event); },
               },
               event);
}

void Session::ignore(const Event &event)
{
    LOG_DEBUG(peer_ << ": ignoring " << eventTypeName(event) << " in state " << stateName(state_));
}

void Session::onDescribe()
{
    State previous = state_;
    state_ = State::Describing;
    out_.send(InfoResponse{ctx_.capabilities, {}});
    state_ = previous;
}

void Session::onTranscribe(const TranscribeRequest &req)
{
    if (state_ == State::Collecting)
    {
        LOG_WARN(peer_ << ": transcribe while collecting, discarding "
                 << buffer_.byteCount() << " buffered bytes");
    }

    buffer_.reset();
    language_ = req.language;
    state_ = State::Collecting;
    LOG_DEBUG(peer_ << ": transcribe request, language='" << language_ << "' model='" << req.name << "'");
}

void Session::onAudioChunk(const AudioChunk &chunk)
{
    if (state_ != State::Collecting)
    {
        LOG_DEBUG(peer_ << ": audio-chunk outside of a transcription, " << chunk.audio.size() << " bytes dropped");
        return;
    }
    buffer_.append(chunk.audio, chunk.format);
}

void Session::onAudioStop()
{
    if (state_ != State::Collecting)
    {
        LOG_DEBUG(peer_ << ": audio-stop in state " << stateName(state_) << " ignored");
        return;
    }

    state_ = State::Finalizing;
    std::string text = transcribeCollected();
    buffer_.reset();
    requests_++;
    state_ = State::Idle;
    out_.send(Transcript{text});
}

std::string Session::transcribeCollected()
{
    if (!ctx_.asr)
    {
        LOG_ERROR(peer_ << ": transcription requested but no ASR backend is configured");
        failures_++;
        return "";
    }
    if (!ctx_.workers)
    {
        LOG_ERROR(peer_ << ": no worker pool for transcription");
        failures_++;
        return "";
    }

    auto start = Clock::now();
    try
    {
        buffer_.downmix();
        buffer_.resample(ctx_.settings.asrSampleRate, ctx_.resampler.get());
        PcmBlock block = buffer_.finalize();

        uint32_t rate = block.format.sampleRateHz;
        double audioSeconds = rate ? static_cast<double>(block.samples.size()) / rate : 0.0;
        std::vector<float> samples = AudioConvert::pcm16ToFloat(block.samples);

        std::shared_ptr<AsrHandle> asr = ctx_.asr;
        auto job = ctx_.workers->submit([asr, rate, samples = std::move(samples)]() {
            return asr->get().transcribe(samples, rate);
        });
        std::string text = job.get();

        LOG_INFO(peer_ << ": transcribed " << audioSeconds << "s of audio in " << msSince(start)
                 << " ms, " << text.size() << " chars");
        return text;
    }
    catch (const BackendError &e)
    {
        LOG_ERROR(peer_ << ": transcription failed: " << e.what());
    }
    catch (const std::exception &e)
    {
        LOG_ERROR(peer_ << ": transcription aborted: " << e.what());
    }
    failures_++;
    return "";
}

void Session::onSynthesize(const SynthesizeRequest &req)
{
    if (state_ == State::Collecting)
    {
        LOG_WARN(peer_ << ": synthesize while collecting, discarding "
                 << buffer_.byteCount() << " buffered bytes");
        buffer_.reset();
    }

    state_ = State::Streaming;

    const SessionSettings &settings = ctx_.settings;
    std::string voice = req.voice.empty() ? settings.defaultVoice : req.voice;
    float speed = std::clamp(req.speed.value_or(settings.defaultSpeed), MIN_SPEED, MAX_SPEED);

    auto start = Clock::now();
    uint64_t samplesSent = 0;

    out_.send(AudioStart{settings.ttsFormat});
    bool ok = streamSynthesis(req.text, voice, speed, samplesSent);
    out_.send(AudioStop{});

    requests_++;
    if (!ok)
        failures_++;
    state_ = State::Idle;

    double elapsed = msSince(start);
    double audioMs = settings.ttsFormat.sampleRateHz
                         ? samplesSent * 1000.0 / settings.ttsFormat.sampleRateHz
                         : 0.0;
    if (audioMs > 0)
    {
        LOG_INFO(peer_ << ": synthesized " << audioMs << " ms of audio in " << elapsed
                 << " ms (RTF " << elapsed / audioMs << ")");
    }
}

bool Session::streamSynthesis(const std::string &text, const std::string &voice, float speed,
                              uint64_t &samplesSent)
{
    const SessionSettings &settings = ctx_.settings;
    const AudioFormat &format = settings.ttsFormat;

    if (!ctx_.tts)
    {
        LOG_ERROR(peer_ << ": synthesis requested but no TTS backend is configured");
        return false;
    }
    if (!ctx_.workers)
    {
        LOG_ERROR(peer_ << ": no worker pool for synthesis");
        return false;
    }

    ChunkReframer reframer(settings.chunkSamples, PCM16_BYTES_PER_SAMPLE);
    auto sendChunk = [&](std::vector<uint8_t> &&bytes) {
        samplesSent += bytes.size() / PCM16_BYTES_PER_SAMPLE;
        out_.send(AudioChunk{format, std::move(bytes)});
    };

    auto channel = std::make_shared<SynthesisChannel>(settings.streamQueueFrames);
    ChannelCloser closer{channel};

    auto start = Clock::now();
    bool ok = false;
    bool first = true;
    try
    {
        std::shared_ptr<TtsHandle> tts = ctx_.tts;
        ctx_.workers->submit([tts, channel, text, voice, speed]() {
            produceSynthesis(tts, channel, text, voice, speed);
        });

        while (std::optional<SynthesisItem> item = channel->waitRead())
        {
            if (item->kind == SynthesisItem::End)
            {
                ok = true;
                break;
            }
            if (item->kind == SynthesisItem::Failed)
            {
                LOG_ERROR(peer_ << ": synthesis failed: " << item->error);
                break;
            }

            if (first)
            {
                LOG_DEBUG(peer_ << ": first audio after " << msSince(start) << " ms");
                first = false;
            }
            for (std::vector<uint8_t> &chunk : reframer.push(item->bytes))
                sendChunk(std::move(chunk));
        }
    }
    catch (const TransportError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR(peer_ << ": synthesis aborted: " << e.what());
    }

    // Audio already produced is delivered even when the backend failed.
    if (std::optional<std::vector<uint8_t>> rest = reframer.flush())
        sendChunk(std::move(*rest));

    return ok;
}
