#include "CapabilityDescriptor.hpp"
#include "Errors.hpp"
#include "ProtocolCodec.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

namespace {

std::string frame(const std::string &header, const std::string &data = "", const std::string &payload = "")
{
    return header + "\n" + data + payload;
}

std::vector<Event> decodeAll(const std::string &wire, CodecLimits limits = CodecLimits{}, size_t maxRead = 4096)
{
    MemoryTransport transport(wire, maxRead);
    EventReader reader(transport, limits);
    std::vector<Event> events;
    while (std::optional<Event> e = reader.next())
        events.push_back(std::move(*e));
    return events;
}

std::string headerLine(const std::vector<uint8_t> &encoded)
{
    auto nl = std::find(encoded.begin(), encoded.end(), '\n');
    return std::string(encoded.begin(), nl);
}

} // namespace

TEST(ProtocolCodec, EncodesHeaderWithLengths)
{
    AudioChunk chunk{AudioFormat{24000, 16, 1}, {1, 2, 3, 4}};
    std::vector<uint8_t> bytes = ProtocolCodec::encode(chunk);

    std::string header = headerLine(bytes);
    std::string data = "{\"rate\":24000,\"width\":2,\"channels\":1}";
    EXPECT_EQ(header, "{\"type\":\"audio-chunk\",\"version\":\"" PROTOCOL_VERSION "\",\"data_length\":"
                          + std::to_string(data.size()) + ",\"payload_length\":4}");

    std::string rest(bytes.begin() + header.size() + 1, bytes.end() - 4);
    EXPECT_EQ(rest, data);
    EXPECT_EQ(std::vector<uint8_t>(bytes.end() - 4, bytes.end()), (std::vector<uint8_t>{1, 2, 3, 4}));
}

TEST(ProtocolCodec, EventWithoutDataHasNoLengths)
{
    std::vector<uint8_t> bytes = ProtocolCodec::encode(AudioStop{});
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()),
              "{\"type\":\"audio-stop\",\"version\":\"" PROTOCOL_VERSION "\"}\n");
}

TEST(ProtocolCodec, EscapesStrings)
{
    std::vector<uint8_t> bytes = ProtocolCodec::encode(Transcript{"say \"hi\"\\\n"});
    std::string wire(bytes.begin(), bytes.end());
    EXPECT_NE(wire.find("{\"text\":\"say \\\"hi\\\"\\\\\\n\"}"), std::string::npos);
}

TEST(ProtocolCodec, InfoCarriesCapabilities)
{
    auto caps = std::make_shared<CapabilityDescriptor>();
    ProgramInfo tts;
    tts.name = "voxgate-tts";
    tts.entries.push_back(ProgramEntry{"af_bella", "voice", {}, true, "1.0", {"en"}});
    caps->tts.push_back(tts);

    std::vector<uint8_t> bytes = ProtocolCodec::encode(InfoResponse{caps, {}});
    std::string wire(bytes.begin(), bytes.end());
    EXPECT_EQ(wire.substr(wire.find('\n') + 1), caps->toJson());
}

TEST(EventReader, DecodesInlineData)
{
    auto events = decodeAll(frame("{\"type\":\"transcribe\",\"data\":{\"language\":\"de\",\"name\":\"large\"}}"));
    ASSERT_EQ(events.size(), 1u);
    auto &req = std::get<TranscribeRequest>(events[0]);
    EXPECT_EQ(req.language, "de");
    EXPECT_EQ(req.name, "large");
}

TEST(EventReader, ExtraDataOverridesInlineData)
{
    std::string data = "{\"text\":\"from data\"}";
    auto events = decodeAll(frame("{\"type\":\"synthesize\",\"data\":{\"text\":\"inline\",\"speed\":1.5},"
                                  "\"data_length\":" + std::to_string(data.size()) + "}",
                                  data));
    ASSERT_EQ(events.size(), 1u);
    auto &req = std::get<SynthesizeRequest>(events[0]);
    EXPECT_EQ(req.text, "from data");
    ASSERT_TRUE(req.speed.has_value());
    EXPECT_FLOAT_EQ(*req.speed, 1.5f);
}

TEST(EventReader, VoiceAsObjectOrString)
{
    auto events = decodeAll(
        frame("{\"type\":\"synthesize\",\"data\":{\"text\":\"a\",\"voice\":{\"name\":\"af_sky\"}}}")
        + frame("{\"type\":\"synthesize\",\"data\":{\"text\":\"b\",\"voice\":\"bm_george\"}}")
        + frame("{\"type\":\"synthesize\",\"data\":{\"text\":\"c\"}}"));
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(std::get<SynthesizeRequest>(events[0]).voice, "af_sky");
    EXPECT_EQ(std::get<SynthesizeRequest>(events[1]).voice, "bm_george");
    EXPECT_EQ(std::get<SynthesizeRequest>(events[2]).voice, "");
    EXPECT_FALSE(std::get<SynthesizeRequest>(events[2]).speed.has_value());
}

TEST(EventReader, AudioChunkPayloadAndFormat)
{
    std::string payload("\x01\x00\x02\x00\x03", 5);
    std::string data = "{\"rate\":44100,\"width\":2,\"channels\":2}";
    auto events = decodeAll(frame("{\"type\":\"audio-chunk\",\"data_length\":" + std::to_string(data.size())
                                  + ",\"payload_length\":5}",
                                  data, payload)
                            + frame("{\"type\":\"audio-chunk\",\"payload_length\":2}", "", "zz"),
                            CodecLimits{}, 3);
    ASSERT_EQ(events.size(), 2u);

    auto &first = std::get<AudioChunk>(events[0]);
    ASSERT_TRUE(first.format.has_value());
    EXPECT_EQ(*first.format, (AudioFormat{44100, 16, 2}));
    EXPECT_EQ(first.audio, (std::vector<uint8_t>{1, 0, 2, 0, 3}));

    auto &second = std::get<AudioChunk>(events[1]);
    EXPECT_FALSE(second.format.has_value());
    EXPECT_EQ(second.audio, (std::vector<uint8_t>{'z', 'z'}));
}

TEST(EventReader, RoundTripsWriterOutput)
{
    MemoryTransport out;
    EventWriter writer(out);
    writer.send(Describe{});
    writer.send(TranscribeRequest{"", "en"});
    writer.send(AudioStart{AudioFormat{16000, 16, 1}});
    writer.send(AudioChunk{AudioFormat{16000, 16, 1}, patternBytes(300)});
    writer.send(AudioStop{});
    writer.send(Ping{"x"});

    auto events = decodeAll(std::string(out.output.begin(), out.output.end()));
    ASSERT_EQ(events.size(), 6u);
    EXPECT_TRUE(std::holds_alternative<Describe>(events[0]));
    EXPECT_EQ(std::get<TranscribeRequest>(events[1]).language, "en");
    EXPECT_EQ(std::get<AudioStart>(events[2]).format, (AudioFormat{16000, 16, 1}));
    EXPECT_EQ(std::get<AudioChunk>(events[3]).audio, patternBytes(300));
    EXPECT_TRUE(std::holds_alternative<AudioStop>(events[4]));
    EXPECT_EQ(std::get<Ping>(events[5]).text, "x");
}

TEST(EventReader, SkipsBlankLinesAndCarriageReturns)
{
    auto events = decodeAll("\n\r\n{\"type\":\"ping\"}\r\n\n{\"type\":\"describe\"}\n");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<Ping>(events[0]));
    EXPECT_TRUE(std::holds_alternative<Describe>(events[1]));
}

TEST(EventReader, UnknownTypeStrictAndLenient)
{
    std::string wire = frame("{\"type\":\"run-satellite\"}") + frame("{\"type\":\"ping\"}");
    EXPECT_THROW(decodeAll(wire), ProtocolError);

    CodecLimits lenient;
    lenient.strictTypes = false;
    auto events = decodeAll(wire, lenient);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<UnknownEvent>(events[0]).type, "run-satellite");
    EXPECT_STREQ(eventTypeName(events[0]), "run-satellite");
}

TEST(EventReader, MalformedHeadersAreProtocolErrors)
{
    EXPECT_THROW(decodeAll(frame("not json")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("[1,2]")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"version\":\"1.5.2\"}")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"ping\",\"data_length\":-1}")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"ping\",\"data_length\":1.5}")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"ping\",\"payload_length\":\"4\"}")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"ping\",\"data\":5}")), ProtocolError);
}

TEST(EventReader, OutOfRangeAudioFormatIsProtocolError)
{
    auto chunk = [](const std::string &data) {
        return frame("{\"type\":\"audio-chunk\",\"data_length\":" + std::to_string(data.size())
                     + ",\"payload_length\":2}",
                     data, "zz");
    };

    EXPECT_THROW(decodeAll(chunk("{\"rate\":16000,\"width\":2,\"channels\":300}")), ProtocolError);
    EXPECT_THROW(decodeAll(chunk("{\"rate\":16000,\"width\":64,\"channels\":1}")), ProtocolError);
    EXPECT_THROW(decodeAll(chunk("{\"rate\":5000000000,\"width\":2,\"channels\":1}")), ProtocolError);
    EXPECT_THROW(decodeAll(chunk("{\"rate\":-8000}")), ProtocolError);
    EXPECT_THROW(decodeAll(chunk("{\"rate\":16000.5}")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"audio-start\",\"data\":{\"channels\":256}}")), ProtocolError);

    auto events = decodeAll(chunk("{\"rate\":4294967295,\"width\":4,\"channels\":255}"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(*std::get<AudioChunk>(events[0]).format, (AudioFormat{4294967295u, 32, 255}));
}

TEST(EventReader, TruncatedFramesAreProtocolErrors)
{
    EXPECT_THROW(decodeAll("{\"type\":\"ping\""), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"ping\",\"data_length\":10}", "{\"a\":")), ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"audio-chunk\",\"payload_length\":8}", "", "1234")), ProtocolError);
}

TEST(EventReader, CleanEndOfStreamBetweenFrames)
{
    EXPECT_TRUE(decodeAll("").empty());
    EXPECT_EQ(decodeAll(frame("{\"type\":\"ping\"}")).size(), 1u);
}

TEST(EventReader, EnforcesLimits)
{
    CodecLimits limits;
    limits.maxPayloadBytes = 16;
    limits.maxDataBytes = 8;
    limits.maxHeaderBytes = 64;

    EXPECT_THROW(decodeAll(frame("{\"type\":\"audio-chunk\",\"payload_length\":17}", "", std::string(17, 'a')), limits),
                 ProtocolError);
    EXPECT_THROW(decodeAll(frame("{\"type\":\"ping\",\"data_length\":9}", "{\"a\":123}"), limits), ProtocolError);
    EXPECT_THROW(decodeAll(std::string(200, ' '), limits), ProtocolError);
    EXPECT_EQ(decodeAll(frame("{\"type\":\"audio-chunk\",\"payload_length\":16}", "", std::string(16, 'a')), limits).size(),
              1u);
}
