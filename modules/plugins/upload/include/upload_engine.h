#ifndef UPLOAD_ENGINE_H
#define UPLOAD_ENGINE_H

#include "bandwidth_throttle.h"
#include "chunk_transfer_worker.h"
#include "resume_store.h"
#include "single_shot_uploader.h"
#include "source_reader.h"
#include "upload_analytics.h"
#include "upload_event_bus.h"
#include "upload_job.h"
#include "upload_transport.h"
#include "upload_types.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ConfigManager;

/**
 * UPLOAD ENGINE
 *
 * Features:
 * - Priority queue (1-10, higher first, FIFO among equal priorities)
 * - Bounded active set of jobs, each running a bounded pool of chunk workers
 * - Resume from durable per-chunk progress after failure, pause or restart
 * - Shared bandwidth throttle with adaptive mode and quiet hours
 * - Typed event stream and periodic analytics
 *
 * Threads: one coordinator making dispatch decisions, one runner per active
 * job, and up to max_concurrent_chunks chunk threads per runner.
 */
class UploadEngine {
public:
    struct Config {
        int max_concurrent_uploads = DEFAULT_MAX_CONCURRENT_UPLOADS;
        int resume_persist_retries = DEFAULT_RESUME_PERSIST_RETRIES;
        std::chrono::milliseconds analytics_interval{ANALYTICS_INTERVAL_MS};
        UploadOptions default_options;

        static Config from_config_manager(const ConfigManager& config);
    };

    /**
     * @param transport Chunk sink, required
     * @param resume_store Progress store, required
     * @param throttle Shared limiter; an unthrottled one is created if null
     * @param single_shot Non-chunked path; defaults to sending through transport
     * @throws std::invalid_argument if transport or resume_store is null
     */
    UploadEngine(Config config,
                 std::shared_ptr<UploadTransport> transport,
                 std::shared_ptr<ResumeStore> resume_store,
                 std::shared_ptr<BandwidthThrottle> throttle = nullptr,
                 std::shared_ptr<SingleShotUploader> single_shot = nullptr);
    ~UploadEngine();

    UploadEngine(const UploadEngine&) = delete;
    UploadEngine& operator=(const UploadEngine&) = delete;

    // Jobs enqueued before start() wait in the queue.
    void start();

    // Pauses active jobs, joins every thread. Queued jobs stay queued.
    void stop();

    bool is_running() const { return m_running.load(); }

    // ==================== JOB CONTROL ====================

    /**
     * Validate and queue a file.
     * @param error Receives the validation failure, if any
     * @return Upload id, empty string if the request was rejected
     */
    std::string enqueue(const FileDescriptor& file,
                        std::shared_ptr<SourceReader> source,
                        int priority,
                        const UploadOptions& options,
                        std::string* error = nullptr);

    // Same, using the engine's default options.
    std::string enqueue(const FileDescriptor& file,
                        std::shared_ptr<SourceReader> source,
                        int priority = DEFAULT_PRIORITY,
                        std::string* error = nullptr);

    /**
     * Queued: removed without touching the transport. Active: no new chunks
     * start, in-flight chunks finish. The resume record is kept.
     * @return false if the id is unknown or already terminal
     */
    bool pause_upload(const std::string& upload_id);

    // As pause_upload, but the resume record is deleted.
    bool cancel_upload(const std::string& upload_id);

    /**
     * Re-enqueue a job from its resume record under the same id. Only chunks
     * missing from the record are transferred.
     * @return Upload id, empty string if there is no record or the job is still live
     */
    std::string resume_upload(const std::string& upload_id,
                              const FileDescriptor& file,
                              std::shared_ptr<SourceReader> source,
                              int priority = DEFAULT_PRIORITY,
                              std::string* error = nullptr);

    // Clamped to [1, 10]. Active jobs are never evicted.
    void set_max_concurrent_uploads(int n);
    int max_concurrent_uploads() const;

    bool set_bandwidth_throttle(const ThrottleSettings& settings, std::string* error = nullptr);

    // ==================== QUERIES ====================

    std::optional<UploadSnapshot> get_upload(const std::string& upload_id) const;

    // Queued jobs in dispatch order, then active, then finished.
    std::vector<UploadSnapshot> list_uploads() const;

    QueueStatus get_queue_status() const;

    AnalyticsSnapshot get_analytics();

    std::vector<ResumeRecord> list_resumable() const;

    // Forget finished jobs. Returns how many were dropped.
    size_t clear_finished();

    UploadEventBus& events() { return m_events; }
    BandwidthThrottle& throttle() { return *m_throttle; }

private:
    struct ActiveEntry {
        std::shared_ptr<UploadJob> job;
        std::thread runner;
    };

    struct TransferOutcome {
        bool ok = false;
        UploadErrorKind kind = UploadErrorKind::NONE;
        std::string error;
    };

    std::string enqueue_job(std::shared_ptr<UploadJob> job, std::string* error);
    bool validate_request(const FileDescriptor& file,
                          const std::shared_ptr<SourceReader>& source,
                          int priority,
                          const UploadOptions& options,
                          std::string* error) const;

    bool stop_upload(const std::string& upload_id, bool keep_resume_record);

    void coordinator_loop();
    void dispatch_locked();
    void request_dispatch();

    void run_job(std::shared_ptr<UploadJob> job);
    TransferOutcome run_chunked(UploadJob& job);
    TransferOutcome run_single_shot(UploadJob& job);
    void settle_job(const std::shared_ptr<UploadJob>& job, const TransferOutcome& outcome);

    EngineCounters sample_counters() const;

    Config m_config;
    std::shared_ptr<UploadTransport> m_transport;
    std::shared_ptr<ResumeStore> m_resume_store;
    std::shared_ptr<BandwidthThrottle> m_throttle;
    std::shared_ptr<SingleShotUploader> m_single_shot;

    UploadEventBus m_events;
    ChunkTransferWorker m_worker;
    AnalyticsAggregator m_analytics;

    mutable std::mutex m_mutex;
    std::condition_variable m_dispatch_cv;
    std::condition_variable m_settled_cv;
    std::deque<std::shared_ptr<UploadJob>> m_queue;
    std::map<std::string, ActiveEntry> m_active;
    std::map<std::string, std::shared_ptr<UploadJob>> m_finished;
    std::vector<std::thread> m_finished_runners;
    int m_max_concurrent_uploads;
    bool m_dispatch_pending = true;
    bool m_stopping = false;

    uint64_t m_completed_count = 0;
    uint64_t m_failed_count = 0;
    uint64_t m_cancelled_count = 0;
    std::atomic<int64_t> m_bytes_transferred{0};

    std::mutex m_lifecycle_mutex;
    std::thread m_coordinator;
    std::atomic<bool> m_running{false};
};

#endif // UPLOAD_ENGINE_H
