#include "BackendHandle.hpp"
#include "CapabilityDescriptor.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "GatewayServer.hpp"
#include "Logger.hpp"
#include "Resampler.hpp"
#include "Session.hpp"
#include "WorkerPool.hpp"
#include "version.hpp"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <pthread.h>
#include <string>

#define MODULE "MAIN"

static void usage(const char *prog)
{
    fprintf(stderr,
        "Usage: %s [-c config.json] [-u uri] [-d] [-h]\n"
        "  -c FILE   configuration file (default: voxgate.json beside the binary, then /etc)\n"
        "  -u URI    listen address, tcp://host:port or unix:///path (overrides server.uri)\n"
        "  -d        debug logging\n"
        "  -h        this help\n",
        prog);
}

static BackendConfig asrBackendConfig(const CFG &c)
{
    BackendConfig bc;
    bc.kind = c.asr.backend;
    bc.url = c.asr.url;
    bc.healthUrl = c.asr.health_url;
    bc.model = c.asr.model;
    bc.language = c.asr.language;
    bc.responseFormat = "json";
    bc.timeoutMs = c.asr.timeout_ms;
    bc.sampleRate = c.asr.target_sample_rate;
    return bc;
}

static BackendConfig ttsBackendConfig(const CFG &c)
{
    BackendConfig bc;
    bc.kind = c.tts.backend;
    bc.url = c.tts.url;
    bc.healthUrl = c.tts.health_url;
    bc.model = c.tts.model;
    bc.responseFormat = c.tts.response_format;
    bc.timeoutMs = c.tts.timeout_ms;
    bc.sampleRate = c.tts.sample_rate;
    return bc;
}

// Builds the backend now instead of on the first request.
template <typename H>
static void preload(H &handle)
{
    try
    {
        handle.get();
        LOG_INFO("backend " << handle.name() << " ready");
    }
    catch (const BackendInitError &e)
    {
        LOG_ERROR("preloading " << handle.name() << " failed: " << e.what());
    }
}

int main(int argc, char **argv)
{
    std::string configPath;
    std::string uri;
    bool debug = false;

    int opt;
    while ((opt = getopt(argc, argv, "c:u:dh")) != -1)
    {
        switch (opt)
        {
        case 'c':
            configPath = optarg;
            break;
        case 'u':
            uri = optarg;
            break;
        case 'd':
            debug = true;
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 1;
        }
    }

    // Signals are taken by sigwait below; worker threads inherit the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    LOG_INFO("Starting " << FULL_VERSION_STRING);

    cfg = std::make_shared<CFG>(configPath);
    if (!configPath.empty() && !cfg->config_loaded)
    {
        LOG_EMER("cannot load " << configPath);
        return 1;
    }
    if (!uri.empty() && !cfg->set<const char *>("server.uri", uri.c_str()))
    {
        LOG_EMER("invalid listen uri " << uri);
        return 1;
    }

    Logger::setLevel(debug ? std::string("DEBUG") : std::string(cfg->general.loglevel));
    if (cfg->general.syslog)
        Logger::enableSyslog("voxgate");

    BackendRegistry &registry = BackendRegistry::getInstance();
    registry.registerBuiltins();

    SessionContext ctx;
    ctx.capabilities = CapabilityDescriptor::fromConfig(*cfg);
    ctx.settings.asrSampleRate = cfg->asr.target_sample_rate;
    ctx.settings.ttsFormat = AudioFormat{(uint32_t)cfg->tts.sample_rate, 16, 1};
    ctx.settings.chunkSamples = cfg->tts.chunk_samples;
    ctx.settings.defaultVoice = cfg->tts.voice;
    ctx.settings.defaultSpeed = cfg->tts.speed;
    ctx.settings.streamQueueFrames = cfg->worker.stream_queue_frames;

    try
    {
        if (cfg->asr.enabled)
        {
            ctx.asr = registry.asr(asrBackendConfig(*cfg));
            ctx.resampler = Resampler::createDefault(cfg->asr.resample_quality);
            if (cfg->asr.preload)
                preload(*ctx.asr);
        }
        if (cfg->tts.enabled)
        {
            ctx.tts = registry.tts(ttsBackendConfig(*cfg));
            if (cfg->tts.preload)
                preload(*ctx.tts);
        }
    }
    catch (const BackendInitError &e)
    {
        LOG_EMER(e.what());
        return 1;
    }

    if (!ctx.asr && !ctx.tts)
        LOG_WARN("both asr and tts are disabled, only describe and ping will be useful");

    WorkerPool workers("backend", cfg->worker.threads, cfg->worker.queue_size);
    ctx.workers = &workers;

    CodecLimits limits;
    limits.maxPayloadBytes = cfg->server.max_payload_bytes;
    limits.strictTypes = cfg->server.strict_events;

    int rc = 0;
    try
    {
        GatewayServer server(cfg->server.uri, cfg->server.max_connections, limits, ctx);
        server.start();

        int sig = 0;
        do
        {
            sigwait(&signals, &sig);
        } while (sig == SIGPIPE);
        LOG_NOTICE("received " << strsignal(sig) << ", shutting down");

        server.stop();
    }
    catch (const TransportError &e)
    {
        LOG_EMER(e.what());
        rc = 1;
    }

    workers.shutdown();
    return rc;
}
