#include "bandwidth_throttle.h"
#include "config_manager.h"
#include "logger.h"
#include "upload_engine.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_defaults() {
    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();

    TEST_ASSERT(config.getLogLevel() == "info", "default log level");
    TEST_ASSERT(!config.isAsyncLogging(), "sync logging by default");
    TEST_ASSERT(config.getMaxConcurrentUploads() == 3, "default upload concurrency");
    TEST_ASSERT(config.getDefaultChunkSize() == 1024 * 1024, "default chunk size");
    TEST_ASSERT(config.getMaxConcurrentChunks() == 3, "default chunk concurrency");
    TEST_ASSERT(config.isResumableByDefault(), "resumable by default");
    TEST_ASSERT(config.getDefaultPriority() == 5, "default priority");
    TEST_ASSERT(config.getMaxBytesPerSecond() == 0, "unthrottled by default");
    TEST_ASSERT(!config.isQuietHoursEnabled(), "quiet hours off by default");
    TEST_ASSERT(config.getAnalyticsIntervalMs() == 5000, "analytics interval");
    return true;
}

static bool test_load_from_string_merges() {
    ConfigManager& config = ConfigManager::getInstance();
    const std::string text = R"({
        "upload_engine": {"max_concurrent_uploads": 6, "default_chunk_size": 65536},
        "bandwidth": {"max_bytes_per_second": 250000, "adaptive": true}
    })";
    TEST_ASSERT(config.loadFromString(text), "valid JSON accepted");
    TEST_ASSERT(config.getMaxConcurrentUploads() == 6, "override applied");
    TEST_ASSERT(config.getDefaultChunkSize() == 65536, "chunk size override");
    TEST_ASSERT(config.getMaxConcurrentChunks() == 3, "untouched key keeps its default");
    TEST_ASSERT(config.getResumeStorePath() == "tmp/resume_data.json", "untouched section keeps its default");
    TEST_ASSERT(config.isAdaptiveThrottling(), "adaptive override");

    TEST_ASSERT(!config.loadFromString("{ nope"), "malformed JSON rejected");
    TEST_ASSERT(!config.loadFromString("[1, 2]"), "non-object root rejected");
    TEST_ASSERT(config.getMaxConcurrentUploads() == 6, "rejected text leaves the previous config");
    return true;
}

static bool test_load_config_file(const std::filesystem::path& workdir) {
    ConfigManager& config = ConfigManager::getInstance();
    const auto path = workdir / "config.json";
    {
        std::ofstream out(path);
        out << R"({"logging": {"level": "debug"}, "resume_store": {"path": "/tmp/x/resume.json"}})";
    }
    TEST_ASSERT(config.loadConfig(path.string()), "file loads");
    TEST_ASSERT(config.getLogLevel() == "debug", "log level from file");
    TEST_ASSERT(config.getResumeStorePath() == "/tmp/x/resume.json", "store path from file");
    TEST_ASSERT(config.getMaxConcurrentUploads() == 3, "file reload starts from defaults");

    TEST_ASSERT(!config.loadConfig((workdir / "missing.json").string()), "missing file fails");
    TEST_ASSERT(config.getLogLevel() == "debug", "failed load leaves config unchanged");
    return true;
}

static bool test_set_value_at_path() {
    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();

    TEST_ASSERT(config.setValueAtPath({"bandwidth", "quiet_hours", "enabled"}, true), "nested set");
    TEST_ASSERT(config.setValueAtPath({"bandwidth", "quiet_hours", "start"}, "23:30"), "nested set start");
    TEST_ASSERT(config.isQuietHoursEnabled(), "quiet hours enabled");
    TEST_ASSERT(config.getQuietHoursStart() == "23:30", "quiet start");
    TEST_ASSERT(config.getQuietHoursEnd() == "06:00", "sibling keys kept");

    TEST_ASSERT(config.setValueAtPath({"brand_new", "deep", "key"}, 42), "intermediate objects created");
    TEST_ASSERT(config.snapshot()["brand_new"]["deep"]["key"] == 42, "value stored");
    TEST_ASSERT(!config.setValueAtPath({}, 1), "empty path rejected");
    return true;
}

static bool test_engine_config_from_manager() {
    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.setValueAtPath({"upload_engine", "max_concurrent_uploads"}, 4);
    config.setValueAtPath({"upload_engine", "default_chunk_size"}, 2048);
    config.setValueAtPath({"upload_engine", "max_concurrent_chunks"}, 5);
    config.setValueAtPath({"upload_engine", "resumable_by_default"}, false);
    config.setValueAtPath({"upload_engine", "resume_persist_retries"}, 7);
    config.setValueAtPath({"analytics", "interval_ms"}, 250);

    const UploadEngine::Config c = UploadEngine::Config::from_config_manager(config);
    TEST_ASSERT(c.max_concurrent_uploads == 4, "max uploads");
    TEST_ASSERT(c.default_options.chunk_size == 2048, "chunk size");
    TEST_ASSERT(c.default_options.max_concurrent_chunks == 5, "chunk concurrency");
    TEST_ASSERT(!c.default_options.resumable, "resumable flag");
    TEST_ASSERT(c.resume_persist_retries == 7, "persist retries");
    TEST_ASSERT(c.analytics_interval == std::chrono::milliseconds(250), "analytics interval");
    return true;
}

static bool test_throttle_settings_from_config() {
    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();

    ThrottleSettings none = throttle_settings_from_config(config);
    TEST_ASSERT(!none.max_bytes_per_second, "0 means unthrottled");
    TEST_ASSERT(!none.quiet_hours, "disabled quiet hours omitted");

    config.setValueAtPath({"bandwidth", "max_bytes_per_second"}, 500000);
    config.setValueAtPath({"bandwidth", "adaptive"}, true);
    config.setValueAtPath({"bandwidth", "quiet_hours", "enabled"}, true);
    config.setValueAtPath({"bandwidth", "quiet_hours", "max_bytes_per_second"}, 1000);

    ThrottleSettings s = throttle_settings_from_config(config);
    TEST_ASSERT(s.max_bytes_per_second == 500000, "cap from config");
    TEST_ASSERT(s.adaptive_throttling, "adaptive from config");
    TEST_ASSERT(s.quiet_hours && s.quiet_hours->start == "22:00" && s.quiet_hours->end == "06:00",
                "quiet window from config");
    TEST_ASSERT(s.quiet_hours->max_bytes_per_second == 1000, "quiet cap from config");

    BandwidthThrottle throttle;
    TEST_ASSERT(throttle.configure(s), "config-derived settings are valid");
    return true;
}

static bool test_log_level_parsing_and_callback() {
    TEST_ASSERT(log_level_from_string("debug") == LogLevel::DEBUG, "debug");
    TEST_ASSERT(log_level_from_string("WARNING") == LogLevel::WARNING, "case-insensitive");
    TEST_ASSERT(log_level_from_string("none") == LogLevel::NONE, "none");
    TEST_ASSERT(log_level_from_string("bogus") == LogLevel::INFO, "unknown maps to info");

    std::mutex mutex;
    std::vector<std::string> lines;
    setLogCallback([&](const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(line);
    });

    set_log_level(LogLevel::WARNING);
    LOG_INFO("CFG: hidden");
    LOG_WARN("CFG: shown");

    enable_async_logging();
    const bool async_on = is_async_logging_enabled();
    LOG_ERROR("CFG: async line");
    disable_async_logging();
    const bool async_off = !is_async_logging_enabled();

    setLogCallback(nullptr);
    set_log_level(LogLevel::ERROR);

    TEST_ASSERT(async_on, "async enabled");
    TEST_ASSERT(async_off, "async disabled");

    std::lock_guard<std::mutex> lock(mutex);
    TEST_ASSERT(lines.size() == 2, "one filtered, two delivered, got " + std::to_string(lines.size()));
    TEST_ASSERT(lines[0].find("WARN: ") != std::string::npos && lines[0].find("CFG: shown") != std::string::npos,
                "warning line formatted");
    TEST_ASSERT(lines[1].find("CFG: async line") != std::string::npos, "async line flushed on disable");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    const auto workdir = std::filesystem::temp_directory_path() / "liteupload_config_tests";
    std::error_code ec;
    std::filesystem::create_directories(workdir, ec);

    std::cout << "--- ConfigManager tests (" << workdir << ") ---" << std::endl;

    if (test_defaults()) std::cout << "PASS: defaults" << std::endl;
    if (test_load_from_string_merges()) std::cout << "PASS: load from string" << std::endl;
    if (test_load_config_file(workdir)) std::cout << "PASS: load config file" << std::endl;
    if (test_set_value_at_path()) std::cout << "PASS: set value at path" << std::endl;
    if (test_engine_config_from_manager()) std::cout << "PASS: engine config from manager" << std::endl;
    if (test_throttle_settings_from_config()) std::cout << "PASS: throttle settings from config" << std::endl;
    if (test_log_level_parsing_and_callback()) std::cout << "PASS: log level and callback" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
