#ifndef AUDIO_FORMAT_HPP
#define AUDIO_FORMAT_HPP

#include <cstdint>
#include <ostream>
#include <vector>

#define PCM16_BYTES_PER_SAMPLE 2
#define DEFAULT_ASR_SAMPLE_RATE 16000

struct AudioFormat
{
    uint32_t sampleRateHz = DEFAULT_ASR_SAMPLE_RATE;
    uint8_t bitsPerSample = 16;
    uint8_t channels = 1;

    // Width in bytes as carried on the wire.
    uint32_t width() const { return bitsPerSample / 8; }

    static AudioFormat fromWire(uint32_t rate, uint32_t width, uint32_t channels)
    {
        AudioFormat f;
        f.sampleRateHz = rate;
        f.bitsPerSample = static_cast<uint8_t>(width * 8);
        f.channels = static_cast<uint8_t>(channels);
        return f;
    }

    bool operator==(const AudioFormat &o) const
    {
        return sampleRateHz == o.sampleRateHz && bitsPerSample == o.bitsPerSample
               && channels == o.channels;
    }
    bool operator!=(const AudioFormat &o) const { return !(*this == o); }
};

inline std::ostream &operator<<(std::ostream &os, const AudioFormat &f)
{
    return os << f.sampleRateHz << " Hz, " << (int) f.bitsPerSample << "-bit, "
              << (int) f.channels << " channel(s)";
}

namespace AudioConvert {

// float = int16 / 32768.0
std::vector<float> pcm16ToFloat(const std::vector<int16_t> &samples);

// int16 = round(float * 32768.0), clamped to the int16 range
int16_t floatToPcm16(float v);
std::vector<int16_t> floatToPcm16(const std::vector<float> &samples);

// Little-endian PCM16 decode; a dangling odd byte is ignored.
std::vector<int16_t> bytesToPcm16(const uint8_t *data, size_t len);
void pcm16ToBytes(const std::vector<int16_t> &samples, std::vector<uint8_t> &out);

} // namespace AudioConvert

#endif // AUDIO_FORMAT_HPP
