#pragma once

#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "../Enhancement/EnhancementConfig.hpp"
#include "../common/AudioQuality.hpp"

namespace call_capture {

class ConfigException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AgcSettings {
    bool realtime = false;
    float targetLevel = 0.5f;
    float maxGainDb = 20.0f;
};

// 0 disables a filter
struct FilterSettings {
    float highPassHz = 0.0f;
    float lowPassHz = 0.0f;
};

struct SilenceTrimSettings {
    bool enabled = false;
    float thresholdRatio = 0.02f;
    unsigned int minSilenceMs = 500;
};

struct AppConfig {
    AudioQuality quality = AudioQuality::Standard();
    bool keepRawCapture = false;
    EnhancementConfig enhancement;
    AgcSettings agc;
    FilterSettings filters;
    SilenceTrimSettings silenceTrim;
};

nlohmann::json ToJson(const AppConfig& config);

// Keys missing from json keep the values already in config.
// Throws ConfigException on wrong types or an unknown quality name.
void MergeJson(const nlohmann::json& json, AppConfig& config);

/**
 * Loads and saves the JSON configuration and hands out copies of it.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Load configuration from file
     * @return false if the file cannot be opened
     * @throws ConfigException if the file is not a valid configuration
     */
    bool Load(const std::string& path);

    // Same as Load for an in-memory document
    void LoadFromString(const std::string& text);

    bool Save(const std::string& path) const;

    void LoadDefaults();

    AppConfig GetConfig() const;
    void ApplyConfig(const AppConfig& config);

    std::string GetConfigPath() const;

private:
    AppConfig _config;
    std::string _configPath;
    mutable std::mutex _mutex;
};

} // namespace call_capture
