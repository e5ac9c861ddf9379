#include "ChunkReframer.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

namespace {

std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts)
{
    std::vector<uint8_t> out;
    for (const auto &p : parts)
        out.insert(out.end(), p.begin(), p.end());
    return out;
}

} // namespace

TEST(ChunkReframer, RejectsZeroSizes)
{
    EXPECT_THROW(ChunkReframer(0, 2), std::invalid_argument);
    EXPECT_THROW(ChunkReframer(1024, 0), std::invalid_argument);
}

TEST(ChunkReframer, SmallFragmentsAreCarried)
{
    ChunkReframer r(4, 2);
    EXPECT_TRUE(r.push(patternBytes(3)).empty());
    EXPECT_EQ(r.pending(), 3u);
    EXPECT_TRUE(r.push(patternBytes(4)).empty());

    auto chunks = r.push(patternBytes(1));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].size(), 8u);
    EXPECT_EQ(r.pending(), 0u);
    EXPECT_FALSE(r.flush().has_value());
}

TEST(ChunkReframer, LargeFragmentSplitsIntoSeveralChunks)
{
    ChunkReframer r(1024, 2);
    auto chunks = r.push(patternBytes(5000));

    ASSERT_EQ(chunks.size(), 2u);
    for (const auto &c : chunks)
        EXPECT_EQ(c.size(), 2048u);
    EXPECT_EQ(r.pending(), 904u);

    auto last = r.flush();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->size(), 904u);
}

TEST(ChunkReframer, PreservesByteOrderAcrossIrregularFragments)
{
    const std::vector<size_t> sizes = {1, 2047, 3, 4096, 0, 5, 1000, 2049};
    std::vector<uint8_t> all = patternBytes(9201, 11);

    ChunkReframer r(1024, 2);
    std::vector<std::vector<uint8_t>> out;
    size_t pos = 0;
    for (size_t n : sizes)
    {
        auto chunks = r.push(all.data() + pos, n);
        pos += n;
        for (auto &c : chunks)
        {
            EXPECT_EQ(c.size(), r.chunkBytes());
            out.push_back(std::move(c));
        }
    }
    ASSERT_EQ(pos, all.size());

    // 9201 bytes: 4 full chunks, 1009 pending bytes, one of them an orphan
    EXPECT_EQ(out.size(), 4u);
    auto last = r.flush();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->size(), 1008u);
    out.push_back(*last);

    std::vector<uint8_t> joined = concat(out);
    std::vector<uint8_t> expected(all.begin(), all.begin() + 9200);
    EXPECT_EQ(joined, expected);
    EXPECT_EQ(r.bytesIn(), 9201u);
    EXPECT_EQ(r.bytesOut(), 9200u);
}

TEST(ChunkReframer, FlushDropsLoneOrphanByte)
{
    ChunkReframer r(4, 2);
    r.push(patternBytes(1));
    EXPECT_FALSE(r.flush().has_value());
    EXPECT_EQ(r.pending(), 0u);
}

TEST(ChunkReframer, UsableAfterFlush)
{
    ChunkReframer r(2, 2);
    r.push(patternBytes(6));
    ASSERT_TRUE(r.flush().has_value());

    auto chunks = r.push(patternBytes(4));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], patternBytes(4));
}
