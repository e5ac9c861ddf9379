#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <functional>
#include <json_config.h>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#define DEFAULT_CONFIG_NAME "voxgate.json"
#define SYSTEM_CONFIG_PATH "/etc/voxgate.json"

template<typename T>
struct ConfigItem {
    const char *path;
    T& value;
    T defaultValue;
    std::function<bool(const T&)> validate;
};

struct _general {
    const char *loglevel;
    bool syslog;
};
struct _server {
    const char *uri;
    int max_connections;
    int max_payload_bytes;
    bool strict_events;
};
struct _worker {
    int threads;
    int queue_size;
    int stream_queue_frames;
};
struct _asr {
    bool enabled;
    bool preload;
    const char *backend;
    const char *url;
    const char *health_url;
    const char *model;
    const char *language;
    const char *languages;
    const char *program_name;
    const char *description;
    const char *attribution_name;
    const char *attribution_url;
    const char *version;
    int target_sample_rate;
    int resample_quality;
    int timeout_ms;
};
struct _tts {
    bool enabled;
    bool preload;
    const char *backend;
    const char *url;
    const char *health_url;
    const char *model;
    const char *voice;
    const char *voices;
    const char *languages;
    const char *response_format;
    const char *program_name;
    const char *description;
    const char *attribution_name;
    const char *attribution_url;
    const char *version;
    float speed;
    int sample_rate;
    int chunk_samples;
    int timeout_ms;
};

class CFG {
	public:
        ~CFG() {
            if (jsonConfig) {
                free_json_value(jsonConfig);
                jsonConfig = nullptr;
            }
        }

        bool config_loaded = false;
        JsonValue *jsonConfig = nullptr;
        std::string filePath{};
        mutable std::mutex configMutex;

        // An empty path searches the binary directory, then /etc.
		explicit CFG(const std::string &path = "");
        void load();
        bool readConfig();

		_general general{};
		_server server{};
		_worker worker{};
		_asr asr{};
		_tts tts{};

    template <typename T>
    bool set(const std::string &name, T value) {
        std::lock_guard<std::mutex> lock(configMutex);
        std::vector<ConfigItem<T>> *items = nullptr;
        if constexpr (std::is_same_v<T, bool>) {
            items = &boolItems;
        } else if constexpr (std::is_same_v<T, const char*>) {
            items = &charItems;
        } else if constexpr (std::is_same_v<T, int>) {
            items = &intItems;
        } else if constexpr (std::is_same_v<T, float>) {
            items = &floatItems;
        } else {
            return false;
        }
        for (auto &item : *items) {
            if (item.path == name) {
                if (item.validate(value)) {
                    item.value = value;
                    return true;
                } else {
                    return false;
                }
            }
        }
        return false;
    }

    private:
        std::string requestedPath;

        std::vector<ConfigItem<bool>> boolItems{};
        std::vector<ConfigItem<const char *>> charItems{};
        std::vector<ConfigItem<int>> intItems{};
        std::vector<ConfigItem<float>> floatItems{};

        std::vector<ConfigItem<bool>> getBoolItems();
        std::vector<ConfigItem<const char *>> getCharItems();
        std::vector<ConfigItem<int>> getIntItems();
        std::vector<ConfigItem<float>> getFloatItems();
};

// The configuration is kept in a global singleton that's accessed via this
// shared_ptr.
extern std::shared_ptr<CFG> cfg;

#endif // CONFIG_HPP
