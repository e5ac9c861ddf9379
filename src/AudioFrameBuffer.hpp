#ifndef AUDIO_FRAME_BUFFER_HPP
#define AUDIO_FRAME_BUFFER_HPP

#include "AudioFormat.hpp"

#include <cstdint>
#include <optional>
#include <vector>

class Resampler;

struct PcmBlock
{
    std::vector<int16_t> samples;
    AudioFormat format;
};

/**
 * Accumulates the PCM16 payloads of one transcription request.
 *
 * The format is taken from the first chunk appended to an empty buffer
 * and stays fixed once audio is buffered, until reset(). Later chunks declaring another format are still appended; the
 * mismatch is only logged, so audio sent at the wrong rate is interpreted
 * with the first chunk's rate.
 */
class AudioFrameBuffer
{
public:
    enum class ResampleResult
    {
        NotNeeded,
        Resampled,
        Unavailable
    };

    AudioFrameBuffer() = default;

    void reset();

    // A chunk without a declared format is accepted as-is; if it is the first
    // chunk, the default 16 kHz / 16-bit / mono format is recorded.
    void append(const uint8_t *data, size_t len, const std::optional<AudioFormat> &format);
    void append(const std::vector<uint8_t> &bytes, const std::optional<AudioFormat> &format)
    {
        append(bytes.data(), bytes.size(), format);
    }

    // Averages interleaved channels into mono. floor(samples / channels) frames remain.
    void downmix();

    // Leaves the samples untouched and returns Unavailable if resampler is null.
    ResampleResult resample(uint32_t targetRateHz, Resampler *resampler);

    PcmBlock finalize() const;

    bool empty() const { return bytes_.empty() && samples_.empty(); }
    bool hasFormat() const { return hasFormat_; }
    const AudioFormat &format() const { return format_; }
    size_t byteCount() const { return decoded_ ? samples_.size() * PCM16_BYTES_PER_SAMPLE : bytes_.size(); }
    uint32_t formatMismatches() const { return formatMismatches_; }

private:
    void decode();

    std::vector<uint8_t> bytes_;
    std::vector<int16_t> samples_;
    AudioFormat format_;
    bool hasFormat_ = false;
    bool decoded_ = false;
    uint32_t formatMismatches_ = 0;
};

#endif // AUDIO_FRAME_BUFFER_HPP
