#include "config_manager.h"
#include "logger.h"
#include <fstream>

static json default_config() {
    return json{
        {"logging", {{"level", "info"}, {"async", false}}},
        {"upload_engine", {
            {"max_concurrent_uploads", 3},
            {"default_chunk_size", 1024 * 1024},
            {"max_concurrent_chunks", 3},
            {"resumable_by_default", true},
            {"resume_persist_retries", 3},
            {"default_priority", 5}
        }},
        {"resume_store", {{"path", "tmp/resume_data.json"}}},
        {"bandwidth", {
            {"max_bytes_per_second", 0},
            {"adaptive", false},
            {"quiet_hours", {
                {"enabled", false},
                {"start", "22:00"},
                {"end", "06:00"},
                {"max_bytes_per_second", 0}
            }}
        }},
        {"analytics", {{"interval_ms", 5000}}}
    };
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager() : m_config(default_config()) {}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_WARN("CFG: Failed to open config file: " + config_path);
        return false;
    }
    try {
        json loaded;
        config_file >> loaded;
        if (!loaded.is_object()) {
            LOG_WARN("CFG: Config root is not an object: " + config_path);
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = default_config();
        m_config.merge_patch(loaded);
    } catch (const std::exception& e) {
        LOG_ERROR("CFG: Config loading failed: " + std::string(e.what()));
        return false;
    }
    LOG_INFO("CFG: Configuration loaded from " + config_path);
    return true;
}

bool ConfigManager::loadFromString(const std::string& content) {
    json loaded = json::parse(content, nullptr, false);
    if (loaded.is_discarded() || !loaded.is_object()) {
        LOG_WARN("CFG: Rejected malformed configuration text");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = default_config();
    m_config.merge_patch(loaded);
    return true;
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = default_config();
}

bool ConfigManager::setValueAtPath(std::initializer_list<std::string> path, const json& value) {
    if (path.size() == 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    size_t depth = 0;
    for (const auto& key : path) {
        if (!node->is_object()) {
            *node = json::object();
        }
        if (++depth == path.size()) {
            (*node)[key] = value;
        } else {
            node = &(*node)[key];
        }
    }
    return true;
}

json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

json ConfigManager::section(const char* name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_config.find(name);
    if (it == m_config.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

std::string ConfigManager::getLogLevel() const {
    return section("logging").value("level", "info");
}

bool ConfigManager::isAsyncLogging() const {
    return section("logging").value("async", false);
}

int ConfigManager::getMaxConcurrentUploads() const {
    return section("upload_engine").value("max_concurrent_uploads", 3);
}

int64_t ConfigManager::getDefaultChunkSize() const {
    return section("upload_engine").value("default_chunk_size", static_cast<int64_t>(1024 * 1024));
}

int ConfigManager::getMaxConcurrentChunks() const {
    return section("upload_engine").value("max_concurrent_chunks", 3);
}

bool ConfigManager::isResumableByDefault() const {
    return section("upload_engine").value("resumable_by_default", true);
}

int ConfigManager::getResumePersistRetries() const {
    return section("upload_engine").value("resume_persist_retries", 3);
}

int ConfigManager::getDefaultPriority() const {
    return section("upload_engine").value("default_priority", 5);
}

std::string ConfigManager::getResumeStorePath() const {
    return section("resume_store").value("path", "tmp/resume_data.json");
}

int64_t ConfigManager::getMaxBytesPerSecond() const {
    return section("bandwidth").value("max_bytes_per_second", static_cast<int64_t>(0));
}

bool ConfigManager::isAdaptiveThrottling() const {
    return section("bandwidth").value("adaptive", false);
}

bool ConfigManager::isQuietHoursEnabled() const {
    return section("bandwidth").value("quiet_hours", json::object()).value("enabled", false);
}

std::string ConfigManager::getQuietHoursStart() const {
    return section("bandwidth").value("quiet_hours", json::object()).value("start", "22:00");
}

std::string ConfigManager::getQuietHoursEnd() const {
    return section("bandwidth").value("quiet_hours", json::object()).value("end", "06:00");
}

int64_t ConfigManager::getQuietHoursMaxBytesPerSecond() const {
    return section("bandwidth").value("quiet_hours", json::object())
        .value("max_bytes_per_second", static_cast<int64_t>(0));
}

int ConfigManager::getAnalyticsIntervalMs() const {
    return section("analytics").value("interval_ms", 5000);
}
