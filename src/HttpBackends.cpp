#include "HttpBackends.hpp"

#include "AudioFormat.hpp"
#include "Errors.hpp"
#include "JsonUtil.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

#include <mutex>

#define MODULE "HTTP_BACKEND"

namespace {

std::mutex g_curl_mutex;
int g_curl_refcount = 0;

void acquire_curl_global()
{
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount == 0)
    {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK)
        {
            throw BackendInitError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    }
    ++g_curl_refcount;
}

void release_curl_global()
{
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount <= 0)
        return;
    if (--g_curl_refcount == 0)
        curl_global_cleanup();
}

struct CurlEasyDeleter
{
    void operator()(CURL *c) const { curl_easy_cleanup(c); }
};
using CurlPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter
{
    void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};
using SlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct CurlMimeDeleter
{
    void operator()(curl_mime *m) const { curl_mime_free(m); }
};
using MimePtr = std::unique_ptr<curl_mime, CurlMimeDeleter>;

size_t appendString(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

CurlPtr newEasy(const std::string &url, int timeoutMs)
{
    CurlPtr curl(curl_easy_init());
    if (!curl)
        throw BackendInvocationError("curl_easy_init failed");
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    if (timeoutMs > 0)
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
    return curl;
}

long responseCode(CURL *curl)
{
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

// GET healthUrl and require a 2xx answer.
void probeHealth(const std::string &healthUrl, int timeoutMs)
{
    if (healthUrl.empty())
        return;

    CurlPtr curl = newEasy(healthUrl, timeoutMs);
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK)
        throw BackendInitError("health check " + healthUrl + " failed: " + curl_easy_strerror(rc));
    long code = responseCode(curl.get());
    if (code < 200 || code >= 300)
        throw BackendInitError("health check " + healthUrl + " returned HTTP " + std::to_string(code));
    LOG_DEBUG("Health check " << healthUrl << " OK");
}

void put_le16(std::vector<uint8_t> &out, uint16_t v)
{
    out.push_back(v & 0xFF);
    out.push_back(v >> 8);
}

void put_le32(std::vector<uint8_t> &out, uint32_t v)
{
    for (int i = 0; i < 4; i++)
        out.push_back((v >> (8 * i)) & 0xFF);
}

/**
 * Pulls the response body of a streaming POST through the curl multi
 * interface, so next() returns as soon as the server has sent anything.
 */
class HttpSynthesisStream : public SynthesisStream
{
public:
    HttpSynthesisStream(const BackendConfig &config, std::string body)
        : body_(std::move(body))
    {
        std::string url = config.url;
        if (!url.empty() && url.back() == '/')
            url.pop_back();
        url += "/audio/speech";

        easy_ = newEasy(url, config.timeoutMs);
        headers_.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(easy_.get(), CURLOPT_HTTPHEADER, headers_.get());
        curl_easy_setopt(easy_.get(), CURLOPT_POSTFIELDS, body_.c_str());
        curl_easy_setopt(easy_.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body_.size()));
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, &HttpSynthesisStream::onData);
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, this);

        multi_ = curl_multi_init();
        if (!multi_)
            throw BackendInvocationError("curl_multi_init failed");
        CURLMcode mc = curl_multi_add_handle(multi_, easy_.get());
        if (mc != CURLM_OK)
        {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
            throw BackendInvocationError(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc));
        }
        LOG_DEBUG("POST " << url << " (streaming)");
    }

    ~HttpSynthesisStream() override
    {
        if (multi_)
        {
            curl_multi_remove_handle(multi_, easy_.get());
            curl_multi_cleanup(multi_);
        }
    }

    bool next(std::vector<uint8_t> &fragment) override
    {
        while (pending_.empty() && !finished_)
            pump();

        if (!pending_.empty())
        {
            fragment.swap(pending_);
            pending_.clear();
            return true;
        }
        if (!error_.empty())
            throw BackendInvocationError(error_);
        return false;
    }

private:
    static size_t onData(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        auto *self = static_cast<HttpSynthesisStream *>(userdata);
        size_t len = size * nmemb;

        long code = responseCode(self->easy_.get());
        if (code >= 400)
        {
            // Keep the error body for the log instead of treating it as audio.
            self->errorBody_.append(ptr, len);
            return len;
        }
        self->pending_.insert(self->pending_.end(), ptr, ptr + len);
        return len;
    }

    void pump()
    {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK)
        {
            finish(std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc));
            return;
        }

        if (running == 0)
        {
            int queued = 0;
            CURLcode result = CURLE_OK;
            while (CURLMsg *msg = curl_multi_info_read(multi_, &queued))
            {
                if (msg->msg == CURLMSG_DONE)
                    result = msg->data.result;
            }

            long code = responseCode(easy_.get());
            if (result != CURLE_OK)
                finish(std::string("synthesis request failed: ") + curl_easy_strerror(result));
            else if (code < 200 || code >= 300)
                finish("synthesis request returned HTTP " + std::to_string(code) + ": " + errorBody_);
            else
                finish("");
            return;
        }

        if (pending_.empty())
        {
            mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
            if (mc != CURLM_OK)
                finish(std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc));
        }
    }

    void finish(const std::string &error)
    {
        finished_ = true;
        error_ = error;
    }

    std::string body_;
    CurlPtr easy_;
    SlistPtr headers_;
    CURLM *multi_ = nullptr;
    std::vector<uint8_t> pending_;
    std::string errorBody_;
    std::string error_;
    bool finished_ = false;
};

} // namespace

namespace HttpUtil {

std::vector<uint8_t> wavBytes(const std::vector<int16_t> &samples, uint32_t sampleRateHz)
{
    const uint32_t dataBytes = static_cast<uint32_t>(samples.size() * PCM16_BYTES_PER_SAMPLE);
    std::vector<uint8_t> out;
    out.reserve(44 + dataBytes);

    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    put_le32(out, 36 + dataBytes);
    out.insert(out.end(), {'W', 'A', 'V', 'E', 'f', 'm', 't', ' '});
    put_le32(out, 16);
    put_le16(out, 1);                                   // PCM
    put_le16(out, 1);                                   // mono
    put_le32(out, sampleRateHz);
    put_le32(out, sampleRateHz * PCM16_BYTES_PER_SAMPLE); // byte rate
    put_le16(out, PCM16_BYTES_PER_SAMPLE);              // block align
    put_le16(out, 16);
    out.insert(out.end(), {'d', 'a', 't', 'a'});
    put_le32(out, dataBytes);

    std::vector<uint8_t> pcm;
    AudioConvert::pcm16ToBytes(samples, pcm);
    out.insert(out.end(), pcm.begin(), pcm.end());
    return out;
}

} // namespace HttpUtil

HttpAsrBackend::HttpAsrBackend(const BackendConfig &config)
    : config_(config)
{
    if (config_.url.empty())
        throw BackendInitError("asr.url is not set");

    acquire_curl_global();
    try
    {
        probeHealth(config_.healthUrl, config_.timeoutMs);
    }
    catch (...)
    {
        release_curl_global();
        throw;
    }
    LOG_INFO("HTTP ASR backend: " << config_.url << " (model " << config_.model << ")");
}

HttpAsrBackend::~HttpAsrBackend()
{
    release_curl_global();
}

std::string HttpAsrBackend::transcribe(const std::vector<float> &samples, uint32_t sampleRateHz)
{
    std::vector<uint8_t> wav = HttpUtil::wavBytes(AudioConvert::floatToPcm16(samples), sampleRateHz);

    CurlPtr curl = newEasy(config_.url, config_.timeoutMs);
    MimePtr mime(curl_mime_init(curl.get()));

    curl_mimepart *part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "file");
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");
    curl_mime_data(part, reinterpret_cast<const char *>(wav.data()), wav.size());

    part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "model");
    curl_mime_data(part, config_.model.c_str(), CURL_ZERO_TERMINATED);

    if (!config_.language.empty())
    {
        part = curl_mime_addpart(mime.get());
        curl_mime_name(part, "language");
        curl_mime_data(part, config_.language.c_str(), CURL_ZERO_TERMINATED);
    }

    part = curl_mime_addpart(mime.get());
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    LOG_DEBUG("POST " << config_.url << " (" << wav.size() << " bytes WAV)");
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK)
        throw BackendInvocationError(std::string("transcription request failed: ") + curl_easy_strerror(rc));

    long code = responseCode(curl.get());
    if (code < 200 || code >= 300)
        throw BackendInvocationError("transcription request returned HTTP " + std::to_string(code) + ": " + response);

    JsonUtil::JsonPtr json = JsonUtil::parse(response);
    const JsonValue *text = JsonUtil::member(json.get(), "text");
    if (!text || text->type != JSON_STRING || !text->value.string)
        throw BackendInvocationError("transcription response has no text: " + response);

    std::string result = text->value.string;
    size_t b = result.find_first_not_of(" \t\r\n");
    size_t e = result.find_last_not_of(" \t\r\n");
    return b == std::string::npos ? std::string() : result.substr(b, e - b + 1);
}

HttpTtsBackend::HttpTtsBackend(const BackendConfig &config)
    : config_(config)
{
    if (config_.url.empty())
        throw BackendInitError("tts.url is not set");

    acquire_curl_global();
    try
    {
        probeHealth(config_.healthUrl, config_.timeoutMs);
    }
    catch (...)
    {
        release_curl_global();
        throw;
    }
    LOG_INFO("HTTP TTS backend: " << config_.url << " (model " << config_.model << ")");
}

HttpTtsBackend::~HttpTtsBackend()
{
    release_curl_global();
}

std::unique_ptr<SynthesisStream> HttpTtsBackend::synthesize(const std::string &text,
                                                            const std::string &voice,
                                                            float speed)
{
    using namespace JsonUtil;

    std::string body = "{";
    bool sep = false;
    add_key(body, sep, "model"); add_str(body, config_.model);
    add_key(body, sep, "voice"); add_str(body, voice);
    add_key(body, sep, "input"); add_str(body, text);
    add_key(body, sep, "response_format"); add_str(body, config_.responseFormat.empty() ? "pcm" : config_.responseFormat);
    add_key(body, sep, "speed"); add_float(body, speed);
    add_key(body, sep, "stream"); add_bool(body, true);
    body += "}";

    return std::make_unique<HttpSynthesisStream>(config_, std::move(body));
}
