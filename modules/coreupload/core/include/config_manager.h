#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <string>

using json = nlohmann::json;

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& content);

    // Replaces the whole document with built-in defaults.
    void resetToDefaults();

    // Sets a value at a nested path, creating intermediate objects as needed.
    bool setValueAtPath(std::initializer_list<std::string> path, const json& value);

    json snapshot() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    // Upload engine
    int getMaxConcurrentUploads() const;
    int64_t getDefaultChunkSize() const;
    int getMaxConcurrentChunks() const;
    bool isResumableByDefault() const;
    int getResumePersistRetries() const;
    int getDefaultPriority() const;

    // Resume store
    std::string getResumeStorePath() const;

    // Bandwidth (0 = unthrottled)
    int64_t getMaxBytesPerSecond() const;
    bool isAdaptiveThrottling() const;
    bool isQuietHoursEnabled() const;
    std::string getQuietHoursStart() const;
    std::string getQuietHoursEnd() const;
    int64_t getQuietHoursMaxBytesPerSecond() const;

    // Analytics
    int getAnalyticsIntervalMs() const;

private:
    ConfigManager();

    json section(const char* name) const;

    mutable std::mutex m_mutex;
    json m_config;
};
