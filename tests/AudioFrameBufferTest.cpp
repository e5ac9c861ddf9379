#include "AudioFrameBuffer.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

TEST(AudioConvert, FloatRangeEndpoints)
{
    std::vector<float> f = AudioConvert::pcm16ToFloat({-32768, 0, 16384, 32767});
    EXPECT_FLOAT_EQ(f[0], -1.0f);
    EXPECT_FLOAT_EQ(f[1], 0.0f);
    EXPECT_FLOAT_EQ(f[2], 0.5f);
    EXPECT_LT(f[3], 1.0f);

    EXPECT_EQ(AudioConvert::floatToPcm16(1.0f), 32767);
    EXPECT_EQ(AudioConvert::floatToPcm16(-1.0f), -32768);
    EXPECT_EQ(AudioConvert::floatToPcm16(-4.0f), -32768);
    EXPECT_EQ(AudioConvert::floatToPcm16(0.5f), 16384);
}

TEST(AudioConvert, LittleEndianDecodeIgnoresDanglingByte)
{
    const uint8_t bytes[] = {0x01, 0x00, 0xff, 0xff, 0x00, 0x80, 0x7f};
    std::vector<int16_t> s = AudioConvert::bytesToPcm16(bytes, sizeof(bytes));
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[0], 1);
    EXPECT_EQ(s[1], -1);
    EXPECT_EQ(s[2], -32768);
}

TEST(AudioFrameBuffer, FirstChunkDefinesFormat)
{
    AudioFrameBuffer buf;
    AudioFormat f{48000, 16, 2};
    buf.append(pcmBytes({1, 2, 3, 4}), f);
    buf.append(pcmBytes({5, 6}), std::nullopt);

    EXPECT_TRUE(buf.hasFormat());
    EXPECT_EQ(buf.format(), f);
    EXPECT_EQ(buf.byteCount(), 12u);
    EXPECT_EQ(buf.formatMismatches(), 0u);
}

TEST(AudioFrameBuffer, MissingFormatUsesDefault)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({10, 20}), std::nullopt);

    EXPECT_EQ(buf.format(), AudioFormat{});
    EXPECT_EQ(buf.format().sampleRateHz, 16000u);
    EXPECT_EQ(buf.format().channels, 1);
}

TEST(AudioFrameBuffer, LaterFormatMismatchKeepsFirstFormat)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({1, 2}), AudioFormat{16000, 16, 1});
    buf.append(pcmBytes({3, 4}), AudioFormat{44100, 16, 1});
    buf.append(pcmBytes({5, 6}), AudioFormat{16000, 16, 1});

    EXPECT_EQ(buf.format().sampleRateHz, 16000u);
    EXPECT_EQ(buf.formatMismatches(), 1u);
    EXPECT_EQ(buf.finalize().samples, (std::vector<int16_t>{1, 2, 3, 4, 5, 6}));
}

TEST(AudioFrameBuffer, EmptyLeadingChunkDoesNotFixFormat)
{
    AudioFrameBuffer buf;
    buf.append(std::vector<uint8_t>{}, AudioFormat{48000, 16, 2});
    buf.append(pcmBytes({0, 0, 0, 0}), AudioFormat{16000, 16, 1});

    EXPECT_EQ(buf.format().sampleRateHz, 16000u);
    EXPECT_EQ(buf.format().channels, 1);
    EXPECT_EQ(buf.formatMismatches(), 0u);
    EXPECT_EQ(buf.finalize().samples.size(), 4u);
}

TEST(AudioFrameBuffer, EmptyChunkAfterAudioKeepsFormat)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({1, 2}), AudioFormat{16000, 16, 1});
    buf.append(std::vector<uint8_t>{}, AudioFormat{48000, 16, 2});

    EXPECT_EQ(buf.format().sampleRateHz, 16000u);
    EXPECT_EQ(buf.formatMismatches(), 1u);
}

TEST(AudioFrameBuffer, ZeroChannelsAssumedMono)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({7, 8}), AudioFormat{16000, 16, 0});
    EXPECT_EQ(buf.format().channels, 1);
}

TEST(AudioFrameBuffer, DownmixAveragesChannels)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({100, 300, -200, -400, 32767, 32767}), AudioFormat{16000, 16, 2});
    buf.downmix();

    PcmBlock block = buf.finalize();
    EXPECT_EQ(block.format.channels, 1);
    EXPECT_EQ(block.samples, (std::vector<int16_t>{200, -300, 32767}));
}

TEST(AudioFrameBuffer, DownmixDropsIncompleteFrame)
{
    AudioFrameBuffer buf;
    // 7 samples of 3-channel audio: two whole frames
    buf.append(pcmBytes({3, 3, 3, 6, 6, 6, 9}), AudioFormat{16000, 16, 3});
    buf.downmix();

    EXPECT_EQ(buf.finalize().samples, (std::vector<int16_t>{3, 6}));
}

TEST(AudioFrameBuffer, DownmixOfMonoIsIdentity)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({1, -1, 5}), AudioFormat{16000, 16, 1});
    buf.downmix();
    EXPECT_EQ(buf.finalize().samples, (std::vector<int16_t>{1, -1, 5}));
}

TEST(AudioFrameBuffer, DanglingByteIsDropped)
{
    AudioFrameBuffer buf;
    std::vector<uint8_t> bytes = pcmBytes({11, 22});
    bytes.push_back(0x33);
    buf.append(bytes, std::nullopt);

    EXPECT_EQ(buf.finalize().samples, (std::vector<int16_t>{11, 22}));
}

TEST(AudioFrameBuffer, ResampleSkippedAtTargetRate)
{
    AudioFrameBuffer buf;
    FakeResampler resampler;
    buf.append(pcmBytes({1, 2, 3, 4}), AudioFormat{16000, 16, 1});

    EXPECT_EQ(buf.resample(16000, &resampler), AudioFrameBuffer::ResampleResult::NotNeeded);
    EXPECT_EQ(resampler.calls, 0);
    EXPECT_EQ(buf.finalize().samples.size(), 4u);
}

TEST(AudioFrameBuffer, ResampleConvertsToTargetRate)
{
    AudioFrameBuffer buf;
    FakeResampler resampler;
    std::vector<int16_t> in(4800, 1000);
    buf.append(pcmBytes(in), AudioFormat{48000, 16, 1});

    EXPECT_EQ(buf.resample(16000, &resampler), AudioFrameBuffer::ResampleResult::Resampled);
    EXPECT_EQ(resampler.calls, 1);
    EXPECT_EQ(resampler.lastIn, 48000u);
    EXPECT_EQ(resampler.lastOut, 16000u);

    PcmBlock block = buf.finalize();
    EXPECT_EQ(block.format.sampleRateHz, 16000u);
    EXPECT_EQ(block.samples.size(), 1600u);
}

TEST(AudioFrameBuffer, ResampleWithoutResamplerKeepsAudio)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({1, 2, 3}), AudioFormat{22050, 16, 1});

    EXPECT_EQ(buf.resample(16000, nullptr), AudioFrameBuffer::ResampleResult::Unavailable);
    PcmBlock block = buf.finalize();
    EXPECT_EQ(block.format.sampleRateHz, 22050u);
    EXPECT_EQ(block.samples, (std::vector<int16_t>{1, 2, 3}));
}

TEST(AudioFrameBuffer, AppendAfterDecodeKeepsOrder)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({1, 2}), std::nullopt);
    buf.downmix();
    buf.append(pcmBytes({3}), std::nullopt);
    EXPECT_EQ(buf.finalize().samples, (std::vector<int16_t>{1, 2, 3}));
}

TEST(AudioFrameBuffer, ResetForgetsEverything)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({1, 2}), AudioFormat{8000, 16, 2});
    buf.append(pcmBytes({3, 4}), AudioFormat{16000, 16, 1});
    buf.reset();

    EXPECT_TRUE(buf.empty());
    EXPECT_FALSE(buf.hasFormat());
    EXPECT_EQ(buf.formatMismatches(), 0u);
    EXPECT_TRUE(buf.finalize().samples.empty());

    buf.append(pcmBytes({5}), AudioFormat{24000, 16, 1});
    EXPECT_EQ(buf.format().sampleRateHz, 24000u);
}

TEST(AudioFrameBuffer, StereoPairsDownmixToTheirMean)
{
    AudioFrameBuffer buf;
    buf.append(pcmBytes({100, 200, 300, 400}), AudioFormat{16000, 16, 2});
    buf.downmix();
    EXPECT_EQ(buf.finalize().samples, (std::vector<int16_t>{150, 350}));
}

TEST(AudioFrameBuffer, SampleCountIsHalfTheBytes)
{
    AudioFrameBuffer buf;
    const AudioFormat f{16000, 16, 1};
    size_t total = 0;
    for (size_t n : {0u, 1u, 640u, 3u, 32000u, 7u})
    {
        buf.append(std::vector<uint8_t>(n, 0), f);
        total += n;
    }

    PcmBlock block = buf.finalize();
    EXPECT_EQ(block.samples.size(), total / 2);

    std::vector<float> f32 = AudioConvert::pcm16ToFloat(block.samples);
    EXPECT_EQ(f32, std::vector<float>(total / 2, 0.0f));
}
