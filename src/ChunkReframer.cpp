#include "ChunkReframer.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <stdexcept>

#define MODULE "ChunkReframer"

ChunkReframer::ChunkReframer(size_t samplesPerChunk, size_t bytesPerSample)
    : bytesPerSample_(bytesPerSample)
    , chunkBytes_(samplesPerChunk * bytesPerSample)
{
    if (samplesPerChunk == 0 || bytesPerSample == 0)
        throw std::invalid_argument("ChunkReframer needs a non-zero chunk size");
    carry_.reserve(chunkBytes_);
}

std::vector<std::vector<uint8_t>> ChunkReframer::push(const uint8_t *data, size_t len)
{
    std::vector<std::vector<uint8_t>> chunks;
    bytesIn_ += len;

    size_t pos = 0;
    while (pos < len)
    {
        size_t take = std::min(chunkBytes_ - carry_.size(), len - pos);
        carry_.insert(carry_.end(), data + pos, data + pos + take);
        pos += take;

        if (carry_.size() == chunkBytes_)
        {
            chunks.emplace_back(std::move(carry_));
            carry_.clear();
            carry_.reserve(chunkBytes_);
            bytesOut_ += chunkBytes_;
        }
    }

    return chunks;
}

std::optional<std::vector<uint8_t>> ChunkReframer::flush()
{
    size_t whole = (carry_.size() / bytesPerSample_) * bytesPerSample_;
    size_t orphan = carry_.size() - whole;
    if (orphan > 0)
    {
        LOG_DEBUG("Discarding " << orphan << " byte(s) of incomplete trailing sample");
    }

    std::optional<std::vector<uint8_t>> last;
    if (whole > 0)
    {
        carry_.resize(whole);
        bytesOut_ += whole;
        last = std::move(carry_);
    }
    carry_.clear();
    return last;
}
