#ifndef BACKEND_HANDLE_HPP
#define BACKEND_HANDLE_HPP

#include "Backend.hpp"
#include "Errors.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class BackendHandleBase
{
public:
    explicit BackendHandleBase(std::string name) : name_(std::move(name)) {}
    virtual ~BackendHandleBase() = default;

    const std::string &name() const { return name_; }
    bool ready() const { return ready_.load(); }
    bool failed() const;
    uint32_t constructions() const { return constructions_.load(); }

protected:
    void onConstructed(double seconds);
    void onFailed(const std::string &error);
    [[noreturn]] void throwFailed() const;

    mutable std::mutex mutex_;
    std::atomic<bool> ready_{false};
    std::atomic<uint32_t> constructions_{0};
    bool failed_ = false;
    std::string error_;

private:
    std::string name_;
};

/**
 * Shared, lazily constructed backend instance.
 *
 * The first get() builds the backend under the handle's mutex; concurrent
 * callers wait for that construction. A failed construction is remembered
 * and every later get() throws the same BackendInitError without retrying.
 */
template <typename T>
class BackendHandle : public BackendHandleBase
{
public:
    using Factory = std::function<std::unique_ptr<T>()>;

    BackendHandle(std::string name, Factory factory)
        : BackendHandleBase(std::move(name))
        , factory_(std::move(factory))
    {
    }

    T &get()
    {
        if (ready_.load(std::memory_order_acquire))
            return *instance_;

        std::lock_guard<std::mutex> lock(mutex_);
        if (instance_)
            return *instance_;
        if (failed_)
            throwFailed();

        auto start = std::chrono::steady_clock::now();
        constructions_++;
        try
        {
            instance_ = factory_();
        }
        catch (const std::exception &e)
        {
            onFailed(e.what());
            throwFailed();
        }
        if (!instance_)
        {
            onFailed("factory returned no instance");
            throwFailed();
        }

        ready_.store(true, std::memory_order_release);
        onConstructed(std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
        return *instance_;
    }

private:
    Factory factory_;
    std::unique_ptr<T> instance_;
};

using AsrHandle = BackendHandle<AsrBackend>;
using TtsHandle = BackendHandle<TtsBackend>;

/**
 * Process-wide table of backend handles keyed by (kind, config).
 * Handles live until process exit.
 */
class BackendRegistry
{
public:
    using AsrFactory = std::function<std::unique_ptr<AsrBackend>(const BackendConfig &)>;
    using TtsFactory = std::function<std::unique_ptr<TtsBackend>(const BackendConfig &)>;

    static BackendRegistry &getInstance()
    {
        static BackendRegistry instance;
        return instance;
    }

    void registerAsr(const std::string &kind, AsrFactory factory);
    void registerTts(const std::string &kind, TtsFactory factory);

    // Adds the providers compiled into this binary.
    void registerBuiltins();

    std::shared_ptr<AsrHandle> asr(const BackendConfig &config);
    std::shared_ptr<TtsHandle> tts(const BackendConfig &config);

private:
    BackendRegistry() = default;
    ~BackendRegistry() = default;

    BackendRegistry(const BackendRegistry &) = delete;
    BackendRegistry &operator=(const BackendRegistry &) = delete;

    std::mutex mutex_;
    std::map<std::string, AsrFactory> asrFactories_;
    std::map<std::string, TtsFactory> ttsFactories_;
    std::map<std::string, std::shared_ptr<AsrHandle>> asrHandles_;
    std::map<std::string, std::shared_ptr<TtsHandle>> ttsHandles_;
};

#endif // BACKEND_HANDLE_HPP
