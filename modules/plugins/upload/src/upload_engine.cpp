#include "upload_engine.h"
#include "chunk_hash.h"
#include "chunk_planner.h"
#include "config_manager.h"
#include "logger.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace {
int clamp_concurrent_uploads(int n) {
    return std::max(MIN_CONCURRENT_UPLOADS, std::min(n, MAX_CONCURRENT_UPLOADS));
}

int64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}
} // namespace

UploadEngine::Config UploadEngine::Config::from_config_manager(const ConfigManager& config) {
    Config c;
    c.max_concurrent_uploads = config.getMaxConcurrentUploads();
    c.resume_persist_retries = config.getResumePersistRetries();
    c.analytics_interval = std::chrono::milliseconds(config.getAnalyticsIntervalMs());
    c.default_options.chunk_size = config.getDefaultChunkSize();
    c.default_options.max_concurrent_chunks = config.getMaxConcurrentChunks();
    c.default_options.resumable = config.isResumableByDefault();
    return c;
}

UploadEngine::UploadEngine(Config config,
                           std::shared_ptr<UploadTransport> transport,
                           std::shared_ptr<ResumeStore> resume_store,
                           std::shared_ptr<BandwidthThrottle> throttle,
                           std::shared_ptr<SingleShotUploader> single_shot)
    : m_config(std::move(config)),
      m_transport(std::move(transport)),
      m_resume_store(std::move(resume_store)),
      m_throttle(throttle ? std::move(throttle) : std::make_shared<BandwidthThrottle>()),
      m_single_shot(single_shot ? std::move(single_shot)
                                : std::make_shared<TransportSingleShotUploader>(m_transport)),
      m_worker(m_transport, m_resume_store, m_throttle, m_events, m_config.resume_persist_retries),
      m_analytics([this] { return sample_counters(); }, m_throttle, &m_events, m_config.analytics_interval),
      m_max_concurrent_uploads(clamp_concurrent_uploads(m_config.max_concurrent_uploads)) {
    if (!m_transport) {
        throw std::invalid_argument("UploadEngine requires a transport");
    }
    if (!m_resume_store) {
        throw std::invalid_argument("UploadEngine requires a resume store");
    }
}

UploadEngine::~UploadEngine() {
    stop();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void UploadEngine::start() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
    if (m_running) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = false;
        m_dispatch_pending = true;
    }
    m_running = true;
    m_coordinator = std::thread(&UploadEngine::coordinator_loop, this);
    m_analytics.start();
    LOG_INFO("UE: Engine started (max concurrent uploads " +
             std::to_string(max_concurrent_uploads()) + ")");
}

void UploadEngine::stop() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
    if (!m_running) {
        return;
    }

    m_analytics.stop();

    size_t interrupted = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
        for (auto& kv : m_active) {
            auto& job = kv.second.job;
            std::lock_guard<std::mutex> job_lock(job->mutex);
            if (!is_terminal(job->status)) {
                job->status = UploadStatus::CANCELLED;
                job->paused = true;
                job->cancel_requested = true;
                ++interrupted;
            }
        }
    }
    m_dispatch_cv.notify_all();
    if (m_coordinator.joinable()) {
        m_coordinator.join();
    }

    std::vector<std::thread> runners;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_settled_cv.wait(lock, [this] { return m_active.empty(); });
        runners = std::move(m_finished_runners);
        m_finished_runners.clear();
    }
    for (auto& t : runners) {
        if (t.joinable()) t.join();
    }

    m_running = false;
    LOG_INFO("UE: Engine stopped (" + std::to_string(interrupted) + " active uploads paused)");
}

// ============================================================================
// ENQUEUE / RESUME
// ============================================================================

bool UploadEngine::validate_request(const FileDescriptor& file,
                                    const std::shared_ptr<SourceReader>& source,
                                    int priority,
                                    const UploadOptions& options,
                                    std::string* error) const {
    auto reject = [&](const std::string& why) {
        LOG_WARN("UE: Rejected upload '" + file.name + "': " + why);
        if (error) *error = why;
        return false;
    };

    if (file.name.empty()) return reject("file name is required");
    if (file.mime_type.empty()) return reject("mime type is required");
    if (file.size <= 0) return reject("file size must be greater than 0");
    if (!source) return reject("source is required");
    if (source->size() != file.size) {
        return reject("source size " + std::to_string(source->size()) +
                      " does not match declared size " + std::to_string(file.size));
    }
    if (priority < MIN_PRIORITY || priority > MAX_PRIORITY) {
        return reject("priority must be between " + std::to_string(MIN_PRIORITY) +
                      " and " + std::to_string(MAX_PRIORITY));
    }
    if (options.chunk_size <= 0 || options.chunk_size > MAX_CHUNK_SIZE) {
        return reject("chunk size must be between 1 and " + std::to_string(MAX_CHUNK_SIZE));
    }
    if (options.max_concurrent_chunks <= 0) {
        return reject("max concurrent chunks must be greater than 0");
    }
    return true;
}

std::string UploadEngine::enqueue(const FileDescriptor& file,
                                  std::shared_ptr<SourceReader> source,
                                  int priority,
                                  std::string* error) {
    return enqueue(file, std::move(source), priority, m_config.default_options, error);
}

std::string UploadEngine::enqueue(const FileDescriptor& file,
                                  std::shared_ptr<SourceReader> source,
                                  int priority,
                                  const UploadOptions& options,
                                  std::string* error) {
    if (!validate_request(file, source, priority, options, error)) {
        return "";
    }

    std::string id;
    std::vector<uint32_t> completed;
    if (options.resumable && options.resume_token && !options.resume_token->empty()) {
        const std::string& token = *options.resume_token;
        auto record = m_resume_store->get(token);
        if (!record) {
            LOG_INFO("UE: No resume record for " + token + ", starting fresh");
        } else if (record->total_chunks != ChunkPlanner::chunk_count(file.size, options.chunk_size) ||
                   record->chunk_size != options.chunk_size) {
            LOG_WARN("UE: Resume record " + token + " does not match " + file.name +
                     " (" + std::to_string(record->total_chunks) + " chunks of " +
                     std::to_string(record->chunk_size) + "), starting fresh");
        } else {
            id = token;
            completed = record->completed_chunks;
        }
    }
    if (id.empty()) {
        id = generate_upload_id();
    }

    auto job = std::make_shared<UploadJob>(id, file, priority, options, std::move(source));
    job->chunks = ChunkPlanner::plan(file.size, options.chunk_size,
                                     job->is_chunked() ? completed : std::vector<uint32_t>{});
    job->bytes_uploaded = ChunkPlanner::uploaded_bytes(job->chunks);
    job->resumed_chunks = static_cast<uint32_t>(job->chunks.size() -
                                                ChunkPlanner::pending_indices(job->chunks).size());

    return enqueue_job(std::move(job), error);
}

std::string UploadEngine::enqueue_job(std::shared_ptr<UploadJob> job, std::string* error) {
    const std::string id = job->id;
    size_t position = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const bool queued = std::any_of(m_queue.begin(), m_queue.end(),
                                        [&](const std::shared_ptr<UploadJob>& j) { return j->id == id; });
        if (queued || m_active.count(id) > 0) {
            const std::string why = "upload " + id + " is already queued or active";
            LOG_WARN("UE: " + why);
            if (error) *error = why;
            return "";
        }
        m_finished.erase(id);

        // Insert before the first job with strictly lower priority (FIFO among equals).
        auto it = std::find_if(m_queue.begin(), m_queue.end(),
                               [&](const std::shared_ptr<UploadJob>& j) { return j->priority < job->priority; });
        position = static_cast<size_t>(std::distance(m_queue.begin(), it));
        m_queue.insert(it, job);
        m_dispatch_pending = true;

        m_events.publish(UploadQueuedEvent{id, job->file.name, job->priority, position});
    }
    m_dispatch_cv.notify_all();

    LOG_INFO("UE: Queued " + job->file.name + " as " + id + " (priority " + std::to_string(job->priority) +
             ", position " + std::to_string(position) + ", " + std::to_string(job->chunks.size()) + " chunks" +
             (job->resumed_chunks > 0 ? ", " + std::to_string(job->resumed_chunks) + " already uploaded" : "") + ")");
    return id;
}

std::string UploadEngine::resume_upload(const std::string& upload_id,
                                        const FileDescriptor& file,
                                        std::shared_ptr<SourceReader> source,
                                        int priority,
                                        std::string* error) {
    auto reject = [&](const std::string& why) {
        LOG_WARN("UE: Cannot resume " + upload_id + ": " + why);
        if (error) *error = why;
        return std::string();
    };

    auto record = m_resume_store->get(upload_id);
    if (!record) {
        return reject("no resume record");
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const bool queued = std::any_of(m_queue.begin(), m_queue.end(),
                                        [&](const std::shared_ptr<UploadJob>& j) { return j->id == upload_id; });
        if (queued || m_active.count(upload_id) > 0) {
            return reject("upload is still queued or active");
        }
    }
    if (record->total_chunks != ChunkPlanner::chunk_count(file.size, record->chunk_size)) {
        return reject("file does not match the recorded chunk layout");
    }

    UploadOptions options = m_config.default_options;
    options.chunk_size = record->chunk_size;
    options.resumable = true;
    options.resume_token = upload_id;

    const std::string id = enqueue(file, std::move(source), priority, options, error);
    if (id.empty()) {
        return id;
    }

    m_events.publish(UploadResumedEvent{id,
                                        static_cast<uint32_t>(record->completed_chunks.size()),
                                        record->total_chunks});
    return id;
}

// ============================================================================
// PAUSE / CANCEL
// ============================================================================

bool UploadEngine::pause_upload(const std::string& upload_id) {
    return stop_upload(upload_id, true);
}

bool UploadEngine::cancel_upload(const std::string& upload_id) {
    return stop_upload(upload_id, false);
}

bool UploadEngine::stop_upload(const std::string& upload_id, bool keep_resume_record) {
    bool removed_from_queue = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto qit = std::find_if(m_queue.begin(), m_queue.end(),
                                [&](const std::shared_ptr<UploadJob>& j) { return j->id == upload_id; });
        if (qit != m_queue.end()) {
            auto job = *qit;
            m_queue.erase(qit);
            int64_t bytes = 0;
            {
                std::lock_guard<std::mutex> job_lock(job->mutex);
                job->status = UploadStatus::CANCELLED;
                job->paused = keep_resume_record;
                job->end_time = std::chrono::system_clock::now();
                bytes = job->bytes_uploaded;
            }
            m_finished[upload_id] = job;
            ++m_cancelled_count;
            if (keep_resume_record) {
                m_events.publish(UploadPausedEvent{upload_id, bytes});
            } else {
                m_events.publish(UploadCancelledEvent{upload_id, bytes, false});
            }
            removed_from_queue = true;
        } else {
            auto ait = m_active.find(upload_id);
            if (ait == m_active.end()) {
                LOG_DEBUG("UE: Stop requested for unknown or finished upload " + upload_id);
                return false;
            }
            auto& job = ait->second.job;
            std::lock_guard<std::mutex> job_lock(job->mutex);
            if (is_terminal(job->status)) {
                return false;
            }
            job->status = UploadStatus::CANCELLED;
            job->paused = keep_resume_record;
            job->cancel_requested = true;
        }
    }

    if (removed_from_queue && !keep_resume_record) {
        if (!m_resume_store->remove(upload_id)) {
            LOG_WARN("UE: Could not delete resume record for " + upload_id);
        }
    }

    LOG_INFO(std::string("UE: ") + (keep_resume_record ? "Paused " : "Cancelled ") + upload_id +
             (removed_from_queue ? " (was queued)" : " (in-flight chunks will finish)"));
    return true;
}

// ============================================================================
// DISPATCH
// ============================================================================

void UploadEngine::request_dispatch() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_dispatch_pending = true;
    }
    m_dispatch_cv.notify_all();
}

void UploadEngine::coordinator_loop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_dispatch_cv.wait(lock, [this] {
            return m_stopping || m_dispatch_pending || !m_finished_runners.empty();
        });

        if (!m_finished_runners.empty()) {
            std::vector<std::thread> runners = std::move(m_finished_runners);
            m_finished_runners.clear();
            lock.unlock();
            for (auto& t : runners) {
                if (t.joinable()) t.join();
            }
            lock.lock();
        }

        if (m_stopping) {
            break;
        }
        if (m_dispatch_pending) {
            m_dispatch_pending = false;
            dispatch_locked();
        }
    }
}

void UploadEngine::dispatch_locked() {
    while (static_cast<int>(m_active.size()) < m_max_concurrent_uploads && !m_queue.empty()) {
        auto job = m_queue.front();
        m_queue.pop_front();

        uint32_t total_chunks = 0;
        {
            std::lock_guard<std::mutex> job_lock(job->mutex);
            job->status = UploadStatus::UPLOADING;
            job->start_time = std::chrono::system_clock::now();
            job->started_at = std::chrono::steady_clock::now();
            total_chunks = static_cast<uint32_t>(job->chunks.size());
        }
        m_events.publish(UploadStartedEvent{job->id, total_chunks, job->is_chunked()});

        ActiveEntry& entry = m_active[job->id];
        entry.job = job;
        try {
            entry.runner = std::thread(&UploadEngine::run_job, this, job);
        } catch (const std::system_error& e) {
            LOG_ERROR("UE: Cannot start runner for " + job->id + ": " + e.what());
            m_active.erase(job->id);
            int64_t bytes = 0;
            {
                std::lock_guard<std::mutex> job_lock(job->mutex);
                job->status = UploadStatus::ERROR;
                job->error = std::string("cannot start transfer thread: ") + e.what();
                job->error_kind = UploadErrorKind::TRANSPORT;
                job->end_time = std::chrono::system_clock::now();
                bytes = job->bytes_uploaded;
            }
            m_finished[job->id] = job;
            ++m_failed_count;
            m_events.publish(UploadErrorEvent{job->id, UploadErrorKind::TRANSPORT, job->error, bytes});
        }
    }
}

// ============================================================================
// TRANSFER
// ============================================================================

void UploadEngine::run_job(std::shared_ptr<UploadJob> job) {
    LOG_INFO("UE: Starting " + job->id + " (" + job->file.name + ", " + std::to_string(job->file.size) +
             " bytes, " + (job->is_chunked() ? "chunked" : "single-shot") + ")");

    TransferOutcome outcome;
    try {
        outcome = job->is_chunked() ? run_chunked(*job) : run_single_shot(*job);
    } catch (const std::exception& e) {
        LOG_ERROR("UE: Transfer of " + job->id + " threw: " + e.what());
        outcome.ok = false;
        outcome.kind = UploadErrorKind::TRANSPORT;
        outcome.error = std::string("unexpected failure: ") + e.what();
    }
    settle_job(job, outcome);
}

UploadEngine::TransferOutcome UploadEngine::run_chunked(UploadJob& job) {
    std::vector<uint32_t> pending;
    uint32_t total_chunks = 0;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        pending = ChunkPlanner::pending_indices(job.chunks);
        total_chunks = static_cast<uint32_t>(job.chunks.size());
    }

    std::atomic<size_t> next_slot{0};
    std::atomic<bool> failed{false};
    std::mutex failure_mutex;
    TransferOutcome failure;

    auto record_failure = [&](UploadErrorKind kind, const std::string& error) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!failed.load()) {
            failure.ok = false;
            failure.kind = kind;
            failure.error = error;
            failed = true;
        }
    };

    auto work = [&]() {
        while (!failed.load() && !job.cancel_requested.load()) {
            const size_t slot = next_slot.fetch_add(1);
            if (slot >= pending.size()) {
                break;
            }
            ChunkTransferWorker::Result result;
            try {
                result = m_worker.transfer(job, pending[slot]);
            } catch (const std::exception& e) {
                LOG_ERROR("UE: Chunk worker for " + job.id + " threw on chunk " +
                          std::to_string(pending[slot]) + ": " + e.what());
                record_failure(UploadErrorKind::TRANSPORT, "chunk " + std::to_string(pending[slot]) +
                                                           ": unexpected failure: " + e.what());
                break;
            }
            m_bytes_transferred += result.bytes_sent;

            if (result.outcome == ChunkTransferWorker::Outcome::FAILED) {
                record_failure(result.error_kind, result.error);
                break;
            }
            if (result.outcome == ChunkTransferWorker::Outcome::ABORTED) {
                break;
            }
        }
    };

    const size_t worker_count = std::min(pending.size(),
                                         static_cast<size_t>(job.options.max_concurrent_chunks));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
        for (size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(work);
        }
    } catch (const std::system_error& e) {
        LOG_ERROR("UE: Could not start chunk worker for " + job.id + ": " + e.what());
        if (workers.empty()) {
            failure.ok = false;
            failure.kind = UploadErrorKind::TRANSPORT;
            failure.error = std::string("cannot start chunk worker: ") + e.what();
            return failure;
        }
    }
    for (auto& t : workers) {
        t.join();
    }

    if (failed.load()) {
        return failure;
    }
    if (job.cancel_requested.load()) {
        return TransferOutcome{};
    }

    {
        std::lock_guard<std::mutex> lock(job.mutex);
        const auto missing = ChunkPlanner::pending_indices(job.chunks);
        if (!missing.empty()) {
            return TransferOutcome{false, UploadErrorKind::TRANSPORT,
                                   std::to_string(missing.size()) + " chunks were not uploaded"};
        }
    }

    std::string finalize_error;
    if (!m_transport->finalize(job.id, job.file.name, total_chunks, finalize_error)) {
        return TransferOutcome{false, UploadErrorKind::TRANSPORT,
                               "finalize failed: " + (finalize_error.empty() ? std::string("unknown") : finalize_error)};
    }
    return TransferOutcome{true, UploadErrorKind::NONE, ""};
}

UploadEngine::TransferOutcome UploadEngine::run_single_shot(UploadJob& job) {
    if (!m_throttle->acquire(job.file.size, [&job] { return job.cancel_requested.load(); })) {
        return TransferOutcome{};
    }

    std::string error;
    if (!m_single_shot->upload(job.id, job.file, *job.source, error)) {
        return TransferOutcome{false, UploadErrorKind::TRANSPORT,
                               error.empty() ? std::string("single-shot upload failed") : error};
    }
    m_throttle->record_sent(job.file.size);
    m_bytes_transferred += job.file.size;

    int64_t bytes_after = 0;
    job.mark_chunk_uploaded(0, "", &bytes_after);
    m_events.publish(UploadProgressEvent{job.id, 0, bytes_after, job.file.size, 100.0f});
    return TransferOutcome{true, UploadErrorKind::NONE, ""};
}

void UploadEngine::settle_job(const std::shared_ptr<UploadJob>& job, const TransferOutcome& outcome) {
    UploadStatus final_status;
    bool paused = false;
    int64_t bytes = 0;
    int64_t elapsed_ms = 0;
    std::string error;
    UploadErrorKind kind = UploadErrorKind::NONE;
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        // A transfer that reached the server is complete even if a cancel raced the final step.
        if (outcome.ok) {
            job->status = UploadStatus::COMPLETED;
            job->paused = false;
        } else if (job->cancel_requested.load() || job->status == UploadStatus::CANCELLED) {
            job->status = UploadStatus::CANCELLED;
        } else {
            job->status = UploadStatus::ERROR;
            job->error = outcome.error;
            job->error_kind = outcome.kind;
        }
        job->end_time = std::chrono::system_clock::now();
        final_status = job->status;
        paused = job->paused;
        bytes = job->bytes_uploaded;
        error = job->error;
        kind = job->error_kind;
        elapsed_ms = elapsed_ms_since(job->started_at);
    }

    const bool drop_record = final_status == UploadStatus::COMPLETED ||
                             (final_status == UploadStatus::CANCELLED && !paused);
    if (drop_record && !m_resume_store->remove(job->id)) {
        LOG_WARN("UE: Could not delete resume record for " + job->id);
    }

    switch (final_status) {
        case UploadStatus::COMPLETED:
            LOG_INFO("UE: Completed " + job->id + " (" + std::to_string(bytes) + " bytes in " +
                     std::to_string(elapsed_ms) + " ms)");
            break;
        case UploadStatus::ERROR:
            LOG_WARN("UE: Upload " + job->id + " failed [" + upload_error_kind_to_string(kind) + "]: " + error);
            break;
        default:
            LOG_INFO("UE: Upload " + job->id + (paused ? " paused" : " cancelled") + " at " +
                     std::to_string(bytes) + " bytes");
            break;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_active.find(job->id);
        if (it != m_active.end()) {
            m_finished_runners.push_back(std::move(it->second.runner));
            m_active.erase(it);
        }
        m_finished[job->id] = job;

        switch (final_status) {
            case UploadStatus::COMPLETED:
                ++m_completed_count;
                m_events.publish(UploadCompletedEvent{job->id, bytes, elapsed_ms});
                break;
            case UploadStatus::ERROR:
                ++m_failed_count;
                m_events.publish(UploadErrorEvent{job->id, kind, error, bytes});
                break;
            default:
                ++m_cancelled_count;
                if (paused) {
                    m_events.publish(UploadPausedEvent{job->id, bytes});
                } else {
                    m_events.publish(UploadCancelledEvent{job->id, bytes, true});
                }
                break;
        }
        m_dispatch_pending = true;
    }
    m_dispatch_cv.notify_all();
    m_settled_cv.notify_all();
}

// ============================================================================
// SETTINGS / QUERIES
// ============================================================================

void UploadEngine::set_max_concurrent_uploads(int n) {
    const int clamped = clamp_concurrent_uploads(n);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_max_concurrent_uploads = clamped;
    }
    if (clamped != n) {
        LOG_DEBUG("UE: Max concurrent uploads " + std::to_string(n) + " clamped to " + std::to_string(clamped));
    }
    request_dispatch();
}

int UploadEngine::max_concurrent_uploads() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_max_concurrent_uploads;
}

bool UploadEngine::set_bandwidth_throttle(const ThrottleSettings& settings, std::string* error) {
    return m_throttle->configure(settings, error);
}

std::optional<UploadSnapshot> UploadEngine::get_upload(const std::string& upload_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& job : m_queue) {
        if (job->id == upload_id) return job->snapshot();
    }
    auto ait = m_active.find(upload_id);
    if (ait != m_active.end()) {
        return ait->second.job->snapshot();
    }
    auto fit = m_finished.find(upload_id);
    if (fit != m_finished.end()) {
        return fit->second->snapshot();
    }
    return std::nullopt;
}

std::vector<UploadSnapshot> UploadEngine::list_uploads() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<UploadSnapshot> out;
    out.reserve(m_queue.size() + m_active.size() + m_finished.size());
    for (const auto& job : m_queue) out.push_back(job->snapshot());
    for (const auto& kv : m_active) out.push_back(kv.second.job->snapshot());
    for (const auto& kv : m_finished) out.push_back(kv.second->snapshot());
    return out;
}

QueueStatus UploadEngine::get_queue_status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    QueueStatus status;
    status.queued = m_queue.size();
    status.active = m_active.size();
    status.total = status.queued + status.active;
    return status;
}

AnalyticsSnapshot UploadEngine::get_analytics() {
    return m_analytics.refresh();
}

std::vector<ResumeRecord> UploadEngine::list_resumable() const {
    return m_resume_store->list();
}

size_t UploadEngine::clear_finished() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t n = m_finished.size();
    m_finished.clear();
    return n;
}

EngineCounters UploadEngine::sample_counters() const {
    EngineCounters counters;
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(m_mutex);
    counters.completed = m_completed_count;
    counters.failed = m_failed_count;
    counters.bytes_transferred = m_bytes_transferred.load();
    counters.active = m_active.size();
    counters.queued = m_queue.size();
    for (const auto& kv : m_active) {
        std::lock_guard<std::mutex> job_lock(kv.second.job->mutex);
        counters.active_elapsed_seconds +=
            std::chrono::duration<double>(now - kv.second.job->started_at).count();
    }
    return counters;
}
