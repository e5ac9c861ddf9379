#include <filesystem>
#include <set>
#include <string>
#include <cstring>
#include <json_config.h>
#include "Config.hpp"
#include "Logger.hpp"

#define MODULE "CONFIG"

namespace fs = std::filesystem;

std::shared_ptr<CFG> cfg;

namespace {

bool validateBool(const bool &v)
{
    return true;
}

bool validateCharDummy(const char *v)
{
    return true;
}

bool validateCharNotEmpty(const char *v)
{
    return v && std::strlen(v) > 0;
}

bool validateUrl(const char *v)
{
    std::string url(v ? v : "");
    return url.empty() || url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

bool validateSampleRate(const int &v)
{
    std::set<int> allowed_rates = {8000, 11025, 16000, 22050, 24000, 32000, 44100, 48000};
    return allowed_rates.count(v) == 1;
}

bool validateTimeout(const int &v)
{
    return v >= 100 && v <= 600000;
}

JsonValue *getNestedValue(JsonValue *root, const std::string &path)
{
    if (!root) return nullptr;
    return get_nested_item(root, path.c_str());
}

std::string jsonValueToString(JsonValue *value)
{
    if (!value) return "";

    switch (value->type) {
        case JSON_STRING:
            return value->value.string ? std::string(value->value.string) : "";
        case JSON_NUMBER:
            return std::to_string(value->value.number);
        case JSON_BOOL:
            return value->value.boolean ? "true" : "false";
        default:
            return "";
    }
}

template<typename T>
T jsonValueToNumber(JsonValue *value, T defaultValue)
{
    if (!value) return defaultValue;

    if (value->type == JSON_NUMBER) {
        return static_cast<T>(value->value.number);
    } else if (value->type == JSON_STRING && value->value.string) {
        try {
            if constexpr (std::is_integral_v<T>) {
                return static_cast<T>(std::stoll(value->value.string));
            } else {
                return static_cast<T>(std::stod(value->value.string));
            }
        } catch (const std::exception &) {
            LOG_WARN("not a number: " << value->value.string);
            return defaultValue;
        }
    }
    return defaultValue;
}

bool jsonValueToBool(JsonValue *value, bool defaultValue)
{
    if (!value) return defaultValue;

    if (value->type == JSON_BOOL) {
        return value->value.boolean != 0;
    } else if (value->type == JSON_STRING && value->value.string) {
        std::string str = value->value.string;
        return str == "true" || str == "1";
    } else if (value->type == JSON_NUMBER) {
        return value->value.number != 0.0;
    }
    return defaultValue;
}

template <typename T>
void handleConfigItem(JsonValue *jsonConfig, ConfigItem<T> &item)
{
    bool readFromConfig = false;

    JsonValue *valueObj = getNestedValue(jsonConfig, item.path);
    if (valueObj) {
        if constexpr (std::is_same_v<T, const char *>) {
            // An explicit empty string is a valid value (e.g. an unset health url).
            if (valueObj->type == JSON_STRING || valueObj->type == JSON_NUMBER) {
                item.value = strdup(jsonValueToString(valueObj).c_str());
                readFromConfig = true;
            }
        } else if constexpr (std::is_same_v<T, bool>) {
            item.value = jsonValueToBool(valueObj, item.defaultValue);
            readFromConfig = true;
        } else if constexpr (std::is_same_v<T, int>) {
            item.value = jsonValueToNumber<int>(valueObj, item.defaultValue);
            readFromConfig = true;
        } else if constexpr (std::is_same_v<T, float>) {
            item.value = jsonValueToNumber<float>(valueObj, item.defaultValue);
            readFromConfig = true;
        }
    }

    if (!readFromConfig)
    {
        item.value = item.defaultValue;
    }
    else if (!item.validate(item.value))
    {
        LOG_ERROR("invalid config value. " << item.path << " = " << item.value);
        item.value = item.defaultValue;
    }
}

} // namespace

std::vector<ConfigItem<bool>> CFG::getBoolItems()
{
    return {
        {"general.syslog", general.syslog, false, validateBool},
        {"server.strict_events", server.strict_events, true, validateBool},
        {"asr.enabled", asr.enabled, true, validateBool},
        {"asr.preload", asr.preload, false, validateBool},
        {"tts.enabled", tts.enabled, true, validateBool},
        {"tts.preload", tts.preload, false, validateBool},
    };
};

std::vector<ConfigItem<const char *>> CFG::getCharItems()
{
    return {
        {"general.loglevel", general.loglevel, "INFO", [](const char *v) {
            std::set<std::string> a = {"EMERGENCY", "ALERT", "CRITICAL", "ERROR", "WARN", "NOTICE", "INFO", "DEBUG"};
            return a.count(std::string(v)) == 1;
        }},
        {"server.uri", server.uri, "tcp://0.0.0.0:10300", [](const char *v) {
            std::string uri(v);
            return uri.rfind("tcp://", 0) == 0 || uri.rfind("unix://", 0) == 0;
        }},
        {"asr.backend", asr.backend, "http", validateCharNotEmpty},
        {"asr.url", asr.url, "http://127.0.0.1:8000/v1/audio/transcriptions", validateUrl},
        {"asr.health_url", asr.health_url, "", validateUrl},
        {"asr.model", asr.model, "whisper-1", validateCharNotEmpty},
        {"asr.language", asr.language, "en", validateCharDummy},
        {"asr.languages", asr.languages, "en", validateCharDummy},
        {"asr.program_name", asr.program_name, "voxgate-asr", validateCharNotEmpty},
        {"asr.description", asr.description, "Speech to text gateway", validateCharDummy},
        {"asr.attribution_name", asr.attribution_name, "voxgate", validateCharDummy},
        {"asr.attribution_url", asr.attribution_url, "", validateCharDummy},
        {"asr.version", asr.version, "1.0.0", validateCharDummy},
        {"tts.backend", tts.backend, "http", validateCharNotEmpty},
        {"tts.url", tts.url, "http://127.0.0.1:8880/v1", validateUrl},
        {"tts.health_url", tts.health_url, "", validateUrl},
        {"tts.model", tts.model, "kokoro", validateCharNotEmpty},
        {"tts.voice", tts.voice, "af_bella", validateCharNotEmpty},
        {"tts.voices", tts.voices, "", validateCharDummy},
        {"tts.languages", tts.languages, "en", validateCharDummy},
        {"tts.response_format", tts.response_format, "pcm", [](const char *v) {
            return std::string(v) == "pcm";
        }},
        {"tts.program_name", tts.program_name, "voxgate-tts", validateCharNotEmpty},
        {"tts.description", tts.description, "Text to speech gateway", validateCharDummy},
        {"tts.attribution_name", tts.attribution_name, "voxgate", validateCharDummy},
        {"tts.attribution_url", tts.attribution_url, "", validateCharDummy},
        {"tts.version", tts.version, "1.0.0", validateCharDummy},
    };
};

std::vector<ConfigItem<int>> CFG::getIntItems()
{
    return {
        {"server.max_connections", server.max_connections, 32, [](const int &v) { return v >= 1 && v <= 4096; }},
        {"server.max_payload_bytes", server.max_payload_bytes, 16 * 1024 * 1024, [](const int &v) { return v >= 4096; }},
        {"worker.threads", worker.threads, 4, [](const int &v) { return v >= 1 && v <= 256; }},
        {"worker.queue_size", worker.queue_size, 64, [](const int &v) { return v >= 1 && v <= 65535; }},
        {"worker.stream_queue_frames", worker.stream_queue_frames, 32, [](const int &v) { return v >= 1 && v <= 4096; }},
        {"asr.target_sample_rate", asr.target_sample_rate, 16000, validateSampleRate},
        {"asr.resample_quality", asr.resample_quality, 5, [](const int &v) { return v >= 0 && v <= 10; }},
        {"asr.timeout_ms", asr.timeout_ms, 60000, validateTimeout},
        {"tts.sample_rate", tts.sample_rate, 24000, validateSampleRate},
        {"tts.chunk_samples", tts.chunk_samples, 1024, [](const int &v) { return v >= 1 && v <= 65536; }},
        {"tts.timeout_ms", tts.timeout_ms, 60000, validateTimeout},
    };
};

std::vector<ConfigItem<float>> CFG::getFloatItems()
{
    return {
        {"tts.speed", tts.speed, 1.0f, [](const float &v) { return v >= 0.5f && v <= 2.0f; }},
    };
};

bool CFG::readConfig()
{
    if (jsonConfig) {
        free_json_value(jsonConfig);
        jsonConfig = nullptr;
    }

    std::string configPath;

    if (!requestedPath.empty()) {
        filePath = requestedPath;
        if (!fs::exists(requestedPath)) {
            LOG_ERROR("Configuration file " << requestedPath << " does not exist");
            return false;
        }
        configPath = requestedPath;
    } else {
        // First try the directory of the program binary, then /etc
        std::error_code ec;
        fs::path binaryPath = fs::read_symlink("/proc/self/exe", ec).parent_path();
        fs::path cfgFilePath = binaryPath / DEFAULT_CONFIG_NAME;
        filePath = cfgFilePath;

        if (!ec && fs::exists(cfgFilePath)) {
            configPath = cfgFilePath.string();
        } else if (fs::exists(SYSTEM_CONFIG_PATH)) {
            filePath = SYSTEM_CONFIG_PATH;
            configPath = SYSTEM_CONFIG_PATH;
        } else {
            LOG_WARN("No " << DEFAULT_CONFIG_NAME << " beside the binary or in /etc, using defaults.");
            return false;
        }
    }

    jsonConfig = load_config(configPath.c_str());
    if (!jsonConfig) {
        LOG_WARN("JSON parse error: Failed to parse " << configPath);
        return false;
    }

    LOG_INFO("Loaded configuration from " << configPath);
    return true;
}

CFG::CFG(const std::string &path) : requestedPath(path)
{
    load();
}

void CFG::load()
{
    std::lock_guard<std::mutex> lock(configMutex);

    boolItems = getBoolItems();
    charItems = getCharItems();
    intItems = getIntItems();
    floatItems = getFloatItems();

    config_loaded = readConfig();
    LOG_DEBUG("CFG::load() - Read config, loaded=" << config_loaded);

    // Without a document every item gets its default.
    for (auto &item : boolItems)
        handleConfigItem(jsonConfig, item);
    for (auto &item : charItems)
        handleConfigItem(jsonConfig, item);
    for (auto &item : intItems)
        handleConfigItem(jsonConfig, item);
    for (auto &item : floatItems)
        handleConfigItem(jsonConfig, item);
}
