#include "bandwidth_throttle.h"
#include "config_manager.h"
#include "logger.h"
#include "resume_store.h"
#include "source_reader.h"
#include "upload_engine.h"
#include "upload_transport.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_interrupted(false);

static void handle_sigint(int) {
    g_interrupted = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] FILE...\n\n"
              << "Uploads files in chunks into a spool directory, resuming from stored progress.\n\n"
              << "Options:\n"
              << "  --config FILE       Path to configuration file (default: config.json)\n"
              << "  --log-level LVL     Log level: debug|info|warning|error|none (default: from config)\n"
              << "  --spool DIR         Destination directory (default: spool)\n"
              << "  --priority N        Priority 1-10 for every file (default: from config)\n"
              << "  --chunk-size BYTES  Chunk size (default: from config)\n"
              << "  --max-chunks N      Concurrent chunks per upload (default: from config)\n"
              << "  --max-uploads N     Concurrent uploads, clamped to 1-10 (default: from config)\n"
              << "  --rate BYTES        Bandwidth cap in bytes/sec (default: from config)\n"
              << "  --adaptive          Enable adaptive throttling\n"
              << "  --resume ID         Continue upload ID using the first FILE\n"
              << "  --list-resumable    Print stored resume records and exit\n"
              << "  --no-hash           Skip per-chunk SHA-256\n"
              << "  --help              Show this help message\n"
              << "\nCtrl-C pauses active uploads; their progress is kept for --resume.\n"
              << std::endl;
}

static bool parse_int64_arg(const std::string& flag, const char* value, int64_t& out) {
    try {
        size_t used = 0;
        const long long v = std::stoll(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        out = static_cast<int64_t>(v);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid " << flag << " value '" << value << "': " << e.what() << std::endl;
        return false;
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, handle_sigint);
    signal(SIGTERM, handle_sigint);

    std::string config_path = "config.json";
    std::string spool_dir = "spool";
    std::string log_level_arg;
    std::string resume_id;
    int64_t priority = -1;
    int64_t chunk_size = -1;
    int64_t max_chunks = -1;
    int64_t max_uploads = -1;
    int64_t rate = -1;
    bool adaptive = false;
    bool list_resumable = false;
    bool no_hash = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto need_value = [&](const std::string& flag) -> const char* {
            if (i + 1 < argc) return argv[++i];
            std::cerr << "Error: " << flag << " requires an argument" << std::endl;
            return nullptr;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            const char* v = need_value(arg);
            if (!v) return 1;
            config_path = v;
        } else if (arg == "--log-level") {
            const char* v = need_value(arg);
            if (!v) return 1;
            log_level_arg = v;
        } else if (arg == "--spool") {
            const char* v = need_value(arg);
            if (!v) return 1;
            spool_dir = v;
        } else if (arg == "--resume") {
            const char* v = need_value(arg);
            if (!v) return 1;
            resume_id = v;
        } else if (arg == "--priority" || arg == "--chunk-size" || arg == "--max-chunks" ||
                   arg == "--max-uploads" || arg == "--rate") {
            const char* v = need_value(arg);
            if (!v) return 1;
            int64_t parsed = 0;
            if (!parse_int64_arg(arg, v, parsed)) return 1;
            if (arg == "--priority") priority = parsed;
            else if (arg == "--chunk-size") chunk_size = parsed;
            else if (arg == "--max-chunks") max_chunks = parsed;
            else if (arg == "--max-uploads") max_uploads = parsed;
            else rate = parsed;
        } else if (arg == "--adaptive") {
            adaptive = true;
        } else if (arg == "--list-resumable") {
            list_resumable = true;
        } else if (arg == "--no-hash") {
            no_hash = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    ConfigManager& config = ConfigManager::getInstance();
    if (std::filesystem::exists(config_path)) {
        if (!config.loadConfig(config_path)) {
            std::cerr << "Error: could not load " << config_path << std::endl;
            return 1;
        }
    }

    set_log_level(log_level_from_string(log_level_arg.empty() ? config.getLogLevel() : log_level_arg));
    if (config.isAsyncLogging()) {
        enable_async_logging();
    }

    auto store = std::make_shared<JsonFileResumeStore>();
    JsonFileResumeStore::Options store_options;
    store_options.path = config.getResumeStorePath();
    if (!store->open(store_options)) {
        std::cerr << "Error: cannot open resume store at " << store_options.path << std::endl;
        return 1;
    }

    if (list_resumable) {
        for (const auto& r : store->list()) {
            std::cout << r.upload_id << "  " << r.filename << "  "
                      << r.completed_chunks.size() << "/" << r.total_chunks << " chunks of "
                      << r.chunk_size << " bytes" << std::endl;
        }
        return 0;
    }

    if (files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    UploadEngine::Config engine_config = UploadEngine::Config::from_config_manager(config);
    if (chunk_size > 0) engine_config.default_options.chunk_size = chunk_size;
    if (max_chunks > 0) engine_config.default_options.max_concurrent_chunks = static_cast<int>(max_chunks);
    if (max_uploads > 0) engine_config.max_concurrent_uploads = static_cast<int>(max_uploads);
    if (no_hash) engine_config.default_options.compute_chunk_hash = false;
    const int job_priority = priority > 0 ? static_cast<int>(priority) : config.getDefaultPriority();

    // Declared before the engine so the event subscriber never outlives them.
    std::mutex done_mutex;
    std::condition_variable done_cv;
    std::set<std::string> pending_ids;
    std::set<std::string> failed_ids;

    auto transport = std::make_shared<SpoolDirectoryTransport>(spool_dir);
    UploadEngine engine(engine_config, transport, store);

    ThrottleSettings throttle = throttle_settings_from_config(config);
    if (rate > 0) throttle.max_bytes_per_second = rate;
    if (adaptive) throttle.adaptive_throttling = true;
    std::string throttle_error;
    if (!engine.set_bandwidth_throttle(throttle, &throttle_error)) {
        std::cerr << "Error: invalid bandwidth settings: " << throttle_error << std::endl;
        return 1;
    }

    engine.events().subscribe([&](const UploadEvent& event) {
        if (const auto* p = std::get_if<UploadProgressEvent>(&event)) {
            std::cout << "  " << p->upload_id << "  chunk " << p->chunk_index << "  "
                      << static_cast<int>(p->progress_percent) << "%" << std::endl;
            return;
        }
        const bool terminal = std::holds_alternative<UploadCompletedEvent>(event) ||
                              std::holds_alternative<UploadErrorEvent>(event) ||
                              std::holds_alternative<UploadCancelledEvent>(event) ||
                              std::holds_alternative<UploadPausedEvent>(event);
        if (const auto* e = std::get_if<UploadErrorEvent>(&event)) {
            std::cerr << "FAILED " << e->upload_id << ": " << e->message << std::endl;
        } else if (const auto* c = std::get_if<UploadCompletedEvent>(&event)) {
            std::cout << "DONE   " << c->upload_id << " (" << c->bytes_uploaded << " bytes, "
                      << c->elapsed_ms << " ms)" << std::endl;
        } else if (const auto* pz = std::get_if<UploadPausedEvent>(&event)) {
            std::cout << "PAUSED " << pz->upload_id << " - resume with --resume " << pz->upload_id << std::endl;
        }
        if (terminal) {
            const std::string id = upload_event_id(event);
            std::lock_guard<std::mutex> lock(done_mutex);
            if (!std::holds_alternative<UploadCompletedEvent>(event)) {
                failed_ids.insert(id);
            }
            pending_ids.erase(id);
            done_cv.notify_all();
        }
    });

    for (size_t i = 0; i < files.size(); ++i) {
        const std::string& path = files[i];
        auto source = open_file_source(path);
        if (!source) {
            std::cerr << "Error: cannot open " << path << std::endl;
            return 1;
        }

        FileDescriptor file;
        file.name = std::filesystem::path(path).filename().string();
        file.size = source->size();
        file.mime_type = guess_mime_type(path);

        std::string error;
        std::string id;
        {
            std::lock_guard<std::mutex> lock(done_mutex);
            if (i == 0 && !resume_id.empty()) {
                id = engine.resume_upload(resume_id, file, source, job_priority, &error);
            } else {
                id = engine.enqueue(file, source, job_priority, &error);
            }
            if (!id.empty()) pending_ids.insert(id);
        }
        if (id.empty()) {
            std::cerr << "Error: " << path << ": " << error << std::endl;
            return 1;
        }
        std::cout << "QUEUED " << id << "  " << file.name << " (" << file.size << " bytes)" << std::endl;
    }

    engine.start();
    {
        std::unique_lock<std::mutex> lock(done_mutex);
        while (!pending_ids.empty() && !g_interrupted) {
            done_cv.wait_for(lock, std::chrono::milliseconds(200));
        }
    }
    if (g_interrupted) {
        std::cout << "Interrupted, pausing uploads..." << std::endl;
    }
    engine.stop();
    engine.events().flush();

    nlohmann::json analytics = engine.get_analytics();
    std::cout << analytics.dump(2) << std::endl;

    if (is_async_logging_enabled()) {
        disable_async_logging();
    }

    std::lock_guard<std::mutex> lock(done_mutex);
    return failed_ids.empty() && pending_ids.empty() && !g_interrupted ? 0 : 2;
}
