#include "AudioFormat.hpp"

#include <cmath>
#include <limits>

namespace AudioConvert {

std::vector<float> pcm16ToFloat(const std::vector<int16_t> &samples)
{
    std::vector<float> out;
    out.reserve(samples.size());
    for (int16_t s : samples)
        out.push_back(static_cast<float>(s / 32768.0));
    return out;
}

int16_t floatToPcm16(float v)
{
    double scaled = std::round(static_cast<double>(v) * 32768.0);
    if (scaled > std::numeric_limits<int16_t>::max())
        return std::numeric_limits<int16_t>::max();
    if (scaled < std::numeric_limits<int16_t>::min())
        return std::numeric_limits<int16_t>::min();
    return static_cast<int16_t>(scaled);
}

std::vector<int16_t> floatToPcm16(const std::vector<float> &samples)
{
    std::vector<int16_t> out;
    out.reserve(samples.size());
    for (float s : samples)
        out.push_back(floatToPcm16(s));
    return out;
}

std::vector<int16_t> bytesToPcm16(const uint8_t *data, size_t len)
{
    size_t count = len / PCM16_BYTES_PER_SAMPLE;
    std::vector<int16_t> out(count);
    for (size_t i = 0; i < count; i++)
    {
        uint16_t lo = data[i * 2];
        uint16_t hi = data[i * 2 + 1];
        out[i] = static_cast<int16_t>(lo | (hi << 8));
    }
    return out;
}

void pcm16ToBytes(const std::vector<int16_t> &samples, std::vector<uint8_t> &out)
{
    out.resize(samples.size() * PCM16_BYTES_PER_SAMPLE);
    for (size_t i = 0; i < samples.size(); i++)
    {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        out[i * 2] = static_cast<uint8_t>(v & 0xFF);
        out[i * 2 + 1] = static_cast<uint8_t>(v >> 8);
    }
}

} // namespace AudioConvert
