#include "BackendHandle.hpp"

#include "HttpBackends.hpp"
#include "Logger.hpp"

#define MODULE "BACKEND"

std::string BackendConfig::key() const
{
    return kind + "|" + url + "|" + healthUrl + "|" + model + "|" + language + "|"
           + responseFormat + "|" + std::to_string(timeoutMs) + "|" + std::to_string(sampleRate);
}

bool BackendHandleBase::failed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void BackendHandleBase::onConstructed(double seconds)
{
    LOG_INFO("Backend " << name_ << " ready after " << seconds << "s");
}

void BackendHandleBase::onFailed(const std::string &error)
{
    failed_ = true;
    error_ = error;
    LOG_ERROR("Backend " << name_ << " failed to initialize: " << error
              << " (not retried until restart)");
}

void BackendHandleBase::throwFailed() const
{
    throw BackendInitError("backend " + name_ + " unavailable: " + error_);
}

void BackendRegistry::registerAsr(const std::string &kind, AsrFactory factory)
{
    std::lock_guard<std::mutex> lock(mutex_);
    asrFactories_[kind] = std::move(factory);
}

void BackendRegistry::registerTts(const std::string &kind, TtsFactory factory)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ttsFactories_[kind] = std::move(factory);
}

void BackendRegistry::registerBuiltins()
{
    registerAsr("http", [](const BackendConfig &c) { return std::make_unique<HttpAsrBackend>(c); });
    registerTts("http", [](const BackendConfig &c) { return std::make_unique<HttpTtsBackend>(c); });
}

std::shared_ptr<AsrHandle> BackendRegistry::asr(const BackendConfig &config)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto &handle = asrHandles_[config.key()];
    if (!handle)
    {
        // Resolve the factory at construction time so an unknown kind
        // becomes a failed handle instead of a startup error.
        handle = std::make_shared<AsrHandle>("asr/" + config.kind + "/" + config.model, [this, config]() {
            AsrFactory factory;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = asrFactories_.find(config.kind);
                if (it != asrFactories_.end())
                    factory = it->second;
            }
            if (!factory)
                throw BackendInitError("unknown asr backend kind '" + config.kind + "'");
            return factory(config);
        });
        LOG_DEBUG("Registered handle " << handle->name());
    }
    return handle;
}

std::shared_ptr<TtsHandle> BackendRegistry::tts(const BackendConfig &config)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto &handle = ttsHandles_[config.key()];
    if (!handle)
    {
        handle = std::make_shared<TtsHandle>("tts/" + config.kind + "/" + config.model, [this, config]() {
            TtsFactory factory;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = ttsFactories_.find(config.kind);
                if (it != ttsFactories_.end())
                    factory = it->second;
            }
            if (!factory)
                throw BackendInitError("unknown tts backend kind '" + config.kind + "'");
            return factory(config);
        });
        LOG_DEBUG("Registered handle " << handle->name());
    }
    return handle;
}
