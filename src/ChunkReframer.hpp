#ifndef CHUNK_REFRAMER_HPP
#define CHUNK_REFRAMER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#define DEFAULT_CHUNK_SAMPLES 1024

/**
 * Cuts an irregular byte stream into chunks of exactly
 * samplesPerChunk * bytesPerSample bytes.
 *
 * Bytes that do not fill a chunk are carried to the next push(). flush()
 * hands out the whole samples still pending; a lone trailing byte that
 * never became a sample is dropped.
 */
class ChunkReframer
{
public:
    explicit ChunkReframer(size_t samplesPerChunk = DEFAULT_CHUNK_SAMPLES,
                           size_t bytesPerSample = 2);

    std::vector<std::vector<uint8_t>> push(const uint8_t *data, size_t len);
    std::vector<std::vector<uint8_t>> push(const std::vector<uint8_t> &bytes)
    {
        return push(bytes.data(), bytes.size());
    }

    std::optional<std::vector<uint8_t>> flush();

    size_t chunkBytes() const { return chunkBytes_; }
    size_t pending() const { return carry_.size(); }
    uint64_t bytesIn() const { return bytesIn_; }
    uint64_t bytesOut() const { return bytesOut_; }

private:
    size_t bytesPerSample_;
    size_t chunkBytes_;
    std::vector<uint8_t> carry_;
    uint64_t bytesIn_ = 0;
    uint64_t bytesOut_ = 0;
};

#endif // CHUNK_REFRAMER_HPP
