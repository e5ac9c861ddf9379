#include "AudioFrameBuffer.hpp"

#include "Logger.hpp"
#include "Resampler.hpp"

#include <cmath>

#define MODULE "AudioFrameBuffer"

void AudioFrameBuffer::reset()
{
    bytes_.clear();
    samples_.clear();
    format_ = AudioFormat{};
    hasFormat_ = false;
    decoded_ = false;
    formatMismatches_ = 0;
}

void AudioFrameBuffer::append(const uint8_t *data, size_t len, const std::optional<AudioFormat> &format)
{
    // Empty chunks do not settle the format while nothing is buffered yet
    if (!hasFormat_ || (empty() && format))
    {
        format_ = format.value_or(AudioFormat{});
        hasFormat_ = true;
        LOG_DEBUG("Audio format: " << format_);
        if (format_.bitsPerSample != 16)
        {
            LOG_WARN("Unsupported sample width " << (int) format_.bitsPerSample
                     << " bits, treating audio as 16-bit PCM");
        }
        if (format_.channels == 0)
        {
            LOG_WARN("Chunk declares 0 channels, assuming mono");
            format_.channels = 1;
        }
    }
    else if (format && *format != format_)
    {
        // Only the first chunk's format is used for the whole request.
        formatMismatches_++;
        LOG_WARN("Chunk format " << *format << " differs from session format "
                 << format_ << ", keeping session format");
    }

    if (len == 0)
        return;

    if (decoded_)
    {
        std::vector<int16_t> more = AudioConvert::bytesToPcm16(data, len);
        samples_.insert(samples_.end(), more.begin(), more.end());
    }
    else
    {
        bytes_.insert(bytes_.end(), data, data + len);
    }
}

void AudioFrameBuffer::decode()
{
    if (decoded_)
        return;

    if (bytes_.size() % PCM16_BYTES_PER_SAMPLE != 0)
    {
        LOG_DEBUG("Dropping dangling byte of incomplete final sample");
    }
    samples_ = AudioConvert::bytesToPcm16(bytes_.data(), bytes_.size());
    bytes_.clear();
    bytes_.shrink_to_fit();
    decoded_ = true;
}

void AudioFrameBuffer::downmix()
{
    decode();

    const size_t channels = format_.channels;
    if (channels <= 1)
        return;

    const size_t frames = samples_.size() / channels;
    std::vector<int16_t> mono(frames);
    for (size_t i = 0; i < frames; i++)
    {
        double sum = 0.0;
        for (size_t c = 0; c < channels; c++)
            sum += samples_[i * channels + c] / 32768.0;
        mono[i] = AudioConvert::floatToPcm16(static_cast<float>(sum / channels));
    }

    LOG_DEBUG("Downmixed " << channels << " channels into " << frames << " mono samples");
    samples_.swap(mono);
    format_.channels = 1;
}

AudioFrameBuffer::ResampleResult AudioFrameBuffer::resample(uint32_t targetRateHz, Resampler *resampler)
{
    decode();

    if (format_.sampleRateHz == targetRateHz)
        return ResampleResult::NotNeeded;

    if (!resampler)
    {
        LOG_WARN("No resampler available for " << format_.sampleRateHz << " Hz -> "
                 << targetRateHz << " Hz; transcription quality may be degraded");
        return ResampleResult::Unavailable;
    }

    std::vector<int16_t> out = resampler->process(samples_, format_.sampleRateHz, targetRateHz);
    LOG_DEBUG("Resampled " << samples_.size() << " samples at " << format_.sampleRateHz
              << " Hz to " << out.size() << " samples at " << targetRateHz << " Hz ("
              << resampler->name() << ")");
    samples_.swap(out);
    format_.sampleRateHz = targetRateHz;
    return ResampleResult::Resampled;
}

PcmBlock AudioFrameBuffer::finalize() const
{
    PcmBlock block;
    block.format = format_;
    if (decoded_)
        block.samples = samples_;
    else
        block.samples = AudioConvert::bytesToPcm16(bytes_.data(), bytes_.size());
    return block;
}
