#include "Errors.hpp"
#include "Event.hpp"
#include "GatewayServer.hpp"
#include "ProtocolCodec.hpp"
#include "Transport.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <netdb.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

static const char *DEFAULT_URI = "tcp://127.0.0.1:10300";
static const size_t SEND_CHUNK_BYTES = 4096;

static int connect_sock(const std::string &uri) {
    Endpoint ep;
    if (!Endpoint::parse(uri, ep)) {
        fprintf(stderr, "voxgatectl: invalid uri %s\n", uri.c_str());
        return -1;
    }

    if (ep.kind == Endpoint::Unix) {
        int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0) return -1;
        sockaddr_un sa{}; sa.sun_family = AF_UNIX;
        strncpy(sa.sun_path, ep.path.c_str(), sizeof(sa.sun_path)-1);
        if (connect(fd, (sockaddr*)&sa, sizeof(sa)) < 0) {
            close(fd); return -1;
        }
        return fd;
    }

    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    std::string port = std::to_string(ep.port);
    if (getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res) != 0) return -1;
    int fd = -1;
    for (addrinfo *ai = res; ai; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        close(fd); fd = -1;
    }
    freeaddrinfo(res);
    return fd;
}

static std::string format_str(const AudioFormat &f) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%uHz/%ubit/%uch", (unsigned)f.sampleRateHz, (unsigned)f.bitsPerSample, (unsigned)f.channels);
    return buf;
}

// Audio read from a WAV or raw PCM16 file.
struct InputAudio {
    std::vector<uint8_t> pcm;
    AudioFormat format;
};

static uint32_t le32(const uint8_t *p) { return p[0] | (p[1] << 8) | (p[2] << 16) | ((uint32_t)p[3] << 24); }
static uint16_t le16(const uint8_t *p) { return p[0] | (p[1] << 8); }

static bool load_audio(const char *file, InputAudio &out) {
    std::ifstream in(file, std::ios::binary);
    if (!in) { fprintf(stderr, "voxgatectl: cannot open %s\n", file); return false; }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (bytes.size() < 12 || memcmp(bytes.data(), "RIFF", 4) != 0 || memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        out.pcm = std::move(bytes);  // raw PCM16, format from the command line
        return true;
    }

    // Walk the RIFF chunks for fmt and data
    size_t pos = 12;
    bool have_fmt = false;
    while (pos + 8 <= bytes.size()) {
        const uint8_t *hdr = bytes.data() + pos;
        uint32_t size = le32(hdr + 4);
        size_t body = pos + 8;
        if (memcmp(hdr, "fmt ", 4) == 0 && body + 16 <= bytes.size()) {
            if (le16(bytes.data() + body) != 1) {
                fprintf(stderr, "voxgatectl: %s is not PCM\n", file);
                return false;
            }
            out.format.channels = le16(bytes.data() + body + 2);
            out.format.sampleRateHz = le32(bytes.data() + body + 4);
            out.format.bitsPerSample = le16(bytes.data() + body + 14);
            have_fmt = true;
        } else if (memcmp(hdr, "data", 4) == 0) {
            size_t end = body + size > bytes.size() ? bytes.size() : body + size;
            out.pcm.assign(bytes.begin() + body, bytes.begin() + end);
            return have_fmt;
        }
        pos = body + size + (size & 1);
    }
    fprintf(stderr, "voxgatectl: %s has no data chunk\n", file);
    return false;
}

// Reads events until one of type T arrives. Returns false on end of stream.
template <typename T>
static bool await(EventReader &reader, T &out) {
    while (std::optional<Event> ev = reader.next()) {
        if (const T *hit = std::get_if<T>(&*ev)) {
            out = *hit;
            return true;
        }
    }
    return false;
}

static int cmd_describe(int fd) {
    SocketTransport transport(fd);
    EventWriter writer(transport);
    EventReader reader(transport);

    writer.send(Describe{});
    InfoResponse info;
    if (!await(reader, info)) { fprintf(stderr, "voxgatectl: no info received\n"); return 1; }
    printf("%s\n", info.data.c_str());
    return 0;
}

static int cmd_ping(int fd) {
    SocketTransport transport(fd);
    EventWriter writer(transport);
    EventReader reader(transport);

    auto start = std::chrono::steady_clock::now();
    writer.send(Ping{"voxgatectl"});
    Pong pong;
    if (!await(reader, pong)) { fprintf(stderr, "voxgatectl: no pong received\n"); return 1; }
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    printf("pong '%s' in %.2f ms\n", pong.text.c_str(), ms);
    return 0;
}

static int cmd_transcribe(int fd, int argc, char **argv) {
    if (argc < 1) { fprintf(stderr, "voxgatectl: transcribe needs a file\n"); return 1; }
    const char *file = argv[0];
    InputAudio audio;
    int rate = -1, channels = -1;
    std::string language;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-r") == 0 && i+1 < argc) { rate = atoi(argv[++i]); }
        else if (strcmp(argv[i], "-n") == 0 && i+1 < argc) { channels = atoi(argv[++i]); }
        else if (strcmp(argv[i], "-l") == 0 && i+1 < argc) { language = argv[++i]; }
    }
    if (!load_audio(file, audio)) return 1;
    if (rate > 0) audio.format.sampleRateHz = rate;
    if (channels > 0) audio.format.channels = channels;

    SocketTransport transport(fd);
    EventWriter writer(transport);
    EventReader reader(transport);

    auto start = std::chrono::steady_clock::now();
    writer.send(TranscribeRequest{"", language});
    writer.send(AudioStart{audio.format});
    for (size_t off = 0; off < audio.pcm.size(); off += SEND_CHUNK_BYTES) {
        size_t n = std::min(SEND_CHUNK_BYTES, audio.pcm.size() - off);
        AudioChunk chunk;
        chunk.format = audio.format;
        chunk.audio.assign(audio.pcm.begin() + off, audio.pcm.begin() + off + n);
        writer.send(chunk);
    }
    writer.send(AudioStop{});

    Transcript transcript;
    if (!await(reader, transcript)) { fprintf(stderr, "voxgatectl: no transcript received\n"); return 1; }
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    printf("%s\n", transcript.text.c_str());
    fprintf(stderr, "%zu bytes %s in %.0f ms\n", audio.pcm.size(), format_str(audio.format).c_str(), ms);
    return transcript.text.empty() ? 1 : 0;
}

static int cmd_synthesize(int fd, int argc, char **argv) {
    if (argc < 1) { fprintf(stderr, "voxgatectl: synthesize needs text\n"); return 1; }
    SynthesizeRequest req;
    req.text = argv[0];
    const char *outPath = nullptr;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 && i+1 < argc) { req.voice = argv[++i]; }
        else if (strcmp(argv[i], "-s") == 0 && i+1 < argc) { req.speed = (float)atof(argv[++i]); }
        else if (strcmp(argv[i], "-o") == 0 && i+1 < argc) { outPath = argv[++i]; }
    }

    FILE *out = stdout;
    if (outPath) {
        out = fopen(outPath, "wb");
        if (!out) { fprintf(stderr, "voxgatectl: cannot write %s: %s\n", outPath, strerror(errno)); return 1; }
    }

    SocketTransport transport(fd);
    EventWriter writer(transport);
    EventReader reader(transport);

    auto start = std::chrono::steady_clock::now();
    writer.send(req);

    AudioFormat format;
    size_t chunks = 0, bytes = 0;
    bool started = false, stopped = false;
    double first_ms = -1;
    while (std::optional<Event> ev = reader.next()) {
        if (const AudioStart *s = std::get_if<AudioStart>(&*ev)) {
            format = s->format;
            started = true;
        } else if (const AudioChunk *c = std::get_if<AudioChunk>(&*ev)) {
            if (first_ms < 0)
                first_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            fwrite(c->audio.data(), 1, c->audio.size(), out);
            chunks++;
            bytes += c->audio.size();
        } else if (std::holds_alternative<AudioStop>(*ev)) {
            stopped = true;
            break;
        }
    }
    if (outPath) fclose(out);

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    fprintf(stderr, "%zu chunks, %zu bytes %s, first audio %.0f ms, total %.0f ms\n",
            chunks, bytes, format_str(format).c_str(), first_ms, ms);
    if (!started || !stopped) { fprintf(stderr, "voxgatectl: incomplete audio stream\n"); return 1; }
    return bytes > 0 ? 0 : 1;
}

static void usage(const char *prog) {
    fprintf(stderr,
        "Usage:\n"
        "  %s [-u URI] describe                                     # print the info data\n"
        "  %s [-u URI] ping\n"
        "  %s [-u URI] transcribe FILE [-r RATE] [-n CH] [-l LANG]   # WAV or raw PCM16\n"
        "  %s [-u URI] synthesize TEXT [-v VOICE] [-s SPEED] [-o OUT] # raw PCM16 to OUT or stdout\n"
        "URI defaults to %s\n",
        prog, prog, prog, prog, DEFAULT_URI);
}

int main(int argc, char **argv) {
    std::string uri = DEFAULT_URI;
    int arg = 1;
    if (argc > 2 && strcmp(argv[1], "-u") == 0) { uri = argv[2]; arg = 3; }
    if (arg >= argc) { usage(argv[0]); return 1; }

    const char *cmd = argv[arg];
    int rest = argc - arg - 1;
    char **rest_argv = argv + arg + 1;
    if (strcmp(cmd, "describe") != 0 && strcmp(cmd, "ping") != 0 &&
        strcmp(cmd, "transcribe") != 0 && strcmp(cmd, "synthesize") != 0) {
        usage(argv[0]); return 1;
    }

    int fd = connect_sock(uri);
    if (fd < 0) { fprintf(stderr, "voxgatectl: connect %s failed: %s\n", uri.c_str(), strerror(errno)); return 2; }

    int rc = 1;
    try {
        if (strcmp(cmd, "describe") == 0) rc = cmd_describe(fd);
        else if (strcmp(cmd, "ping") == 0) rc = cmd_ping(fd);
        else if (strcmp(cmd, "transcribe") == 0) rc = cmd_transcribe(fd, rest, rest_argv);
        else rc = cmd_synthesize(fd, rest, rest_argv);
    } catch (const ProtocolError &e) {
        fprintf(stderr, "voxgatectl: protocol error: %s\n", e.what());
        rc = 3;
    } catch (const TransportError &e) {
        fprintf(stderr, "voxgatectl: connection error: %s\n", e.what());
        rc = 2;
    }
    close(fd);
    return rc;
}
