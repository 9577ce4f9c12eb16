#include "ConfigManager.hpp"
#include "../common/debug_log.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

using nlohmann::json;

namespace call_capture {

namespace {

template <typename T>
void ReadKey(const json& object, const char* key, T& value) {
    auto it = object.find(key);
    if (it != object.end()) {
        value = it->get<T>();
    }
}

const json* Section(const json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigException(std::string("Config section '") + key + "' must be an object");
    }
    return &*it;
}

} // namespace

json ToJson(const AppConfig& config) {
    const EnhancementConfig& e = config.enhancement;
    return json{
        {"quality", config.quality.Name()},
        {"keepRawCapture", config.keepRawCapture},
        {"enhancement", {
            {"noiseReduction", e.noiseReduction},
            {"compression", e.compression},
            {"normalization", e.normalization},
            {"targetGainDb", e.targetGainDb}
        }},
        {"noiseGate", {
            {"thresholdRatio", e.noiseGate.thresholdRatio},
            {"reduction", e.noiseGate.reduction}
        }},
        {"compressor", {
            {"thresholdRatio", e.compressor.thresholdRatio},
            {"ratio", e.compressor.ratio},
            {"attackMs", e.compressor.attackMs},
            {"releaseMs", e.compressor.releaseMs}
        }},
        {"agc", {
            {"realtime", config.agc.realtime},
            {"targetLevel", config.agc.targetLevel},
            {"maxGainDb", config.agc.maxGainDb}
        }},
        {"filters", {
            {"highPassHz", config.filters.highPassHz},
            {"lowPassHz", config.filters.lowPassHz}
        }},
        {"silenceTrim", {
            {"enabled", config.silenceTrim.enabled},
            {"thresholdRatio", config.silenceTrim.thresholdRatio},
            {"minSilenceMs", config.silenceTrim.minSilenceMs}
        }}
    };
}

void MergeJson(const json& document, AppConfig& config) {
    if (!document.is_object()) {
        throw ConfigException("Config root must be an object");
    }

    try {
        auto quality = document.find("quality");
        if (quality != document.end()) {
            const std::string name = quality->get<std::string>();
            auto preset = AudioQuality::FromName(name);
            if (!preset) {
                throw ConfigException("Unknown audio quality: " + name);
            }
            config.quality = *preset;
        }
        ReadKey(document, "keepRawCapture", config.keepRawCapture);

        EnhancementConfig& e = config.enhancement;
        if (const json* section = Section(document, "enhancement")) {
            ReadKey(*section, "noiseReduction", e.noiseReduction);
            ReadKey(*section, "compression", e.compression);
            ReadKey(*section, "normalization", e.normalization);
            ReadKey(*section, "targetGainDb", e.targetGainDb);
        }
        if (const json* section = Section(document, "noiseGate")) {
            ReadKey(*section, "thresholdRatio", e.noiseGate.thresholdRatio);
            ReadKey(*section, "reduction", e.noiseGate.reduction);
        }
        if (const json* section = Section(document, "compressor")) {
            ReadKey(*section, "thresholdRatio", e.compressor.thresholdRatio);
            ReadKey(*section, "ratio", e.compressor.ratio);
            ReadKey(*section, "attackMs", e.compressor.attackMs);
            ReadKey(*section, "releaseMs", e.compressor.releaseMs);
        }
        if (const json* section = Section(document, "agc")) {
            ReadKey(*section, "realtime", config.agc.realtime);
            ReadKey(*section, "targetLevel", config.agc.targetLevel);
            ReadKey(*section, "maxGainDb", config.agc.maxGainDb);
        }
        if (const json* section = Section(document, "filters")) {
            ReadKey(*section, "highPassHz", config.filters.highPassHz);
            ReadKey(*section, "lowPassHz", config.filters.lowPassHz);
        }
        if (const json* section = Section(document, "silenceTrim")) {
            ReadKey(*section, "enabled", config.silenceTrim.enabled);
            ReadKey(*section, "thresholdRatio", config.silenceTrim.thresholdRatio);
            auto minSilence = section->find("minSilenceMs");
            if (minSilence != section->end()) {
                const int64_t value = minSilence->get<int64_t>();
                if (value < 0 || value > std::numeric_limits<unsigned int>::max()) {
                    throw ConfigException("silenceTrim.minSilenceMs out of range: " +
                                          std::to_string(value));
                }
                config.silenceTrim.minSilenceMs = static_cast<unsigned int>(value);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigException(std::string("Invalid config value: ") + e.what());
    }
}

bool ConfigManager::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ERROR_LOG("Could not open config file: " << path);
        return false;
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigException("Could not parse " + path + ": " + e.what());
    }

    AppConfig config = GetConfig();
    MergeJson(document, config);

    std::lock_guard<std::mutex> lock(_mutex);
    _config = config;
    _configPath = path;
    DEBUG_LOG("Config loaded from " << path << DEBUG_LOG_ENDL);
    return true;
}

void ConfigManager::LoadFromString(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigException(std::string("Could not parse config: ") + e.what());
    }

    AppConfig config = GetConfig();
    MergeJson(document, config);

    std::lock_guard<std::mutex> lock(_mutex);
    _config = config;
}

bool ConfigManager::Save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        ERROR_LOG("Could not open config file for writing: " << path);
        return false;
    }

    file << ToJson(GetConfig()).dump(2) << '\n';
    return static_cast<bool>(file);
}

void ConfigManager::LoadDefaults() {
    std::lock_guard<std::mutex> lock(_mutex);
    _config = AppConfig{};
}

AppConfig ConfigManager::GetConfig() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _config;
}

void ConfigManager::ApplyConfig(const AppConfig& config) {
    std::lock_guard<std::mutex> lock(_mutex);
    _config = config;
}

std::string ConfigManager::GetConfigPath() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _configPath;
}

} // namespace call_capture
