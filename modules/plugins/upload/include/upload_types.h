#ifndef UPLOAD_TYPES_H
#define UPLOAD_TYPES_H

#include <cstdint>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * UPLOAD TYPES AND COMMON DEFINITIONS
 *
 * Shared enums, constants and value structures used by the engine, the chunk
 * workers, the resume store and the analytics aggregator.
 */

// ============================================================================
// ENUMS
// ============================================================================

enum class UploadStatus {
    QUEUED,         // Waiting in the priority queue
    UPLOADING,      // Admitted to the active set
    COMPLETED,      // Every chunk sent and finalized
    ERROR,          // Transport / source failure
    CANCELLED       // Cancelled or paused by the caller
};

enum class UploadErrorKind {
    NONE,
    VALIDATION,                 // Rejected at enqueue
    TRANSPORT,                  // Chunk send or finalize failed
    SOURCE_READ,                // Source could not deliver the requested range
    THROTTLE_MISCONFIGURATION,  // Invalid bandwidth settings
    RESUME_STORE                // Progress could not be persisted
};

const char* upload_status_to_string(UploadStatus status);
const char* upload_error_kind_to_string(UploadErrorKind kind);

inline bool is_terminal(UploadStatus status) {
    return status == UploadStatus::COMPLETED ||
           status == UploadStatus::ERROR ||
           status == UploadStatus::CANCELLED;
}

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr int64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;             // 1 MiB
constexpr int64_t MAX_CHUNK_SIZE = 256LL * 1024 * 1024;         // 256 MiB
constexpr int DEFAULT_MAX_CONCURRENT_CHUNKS = 3;
constexpr int DEFAULT_MAX_CONCURRENT_UPLOADS = 3;
constexpr int MIN_CONCURRENT_UPLOADS = 1;
constexpr int MAX_CONCURRENT_UPLOADS = 10;
constexpr int MIN_PRIORITY = 1;
constexpr int MAX_PRIORITY = 10;
constexpr int DEFAULT_PRIORITY = 5;
constexpr int DEFAULT_RESUME_PERSIST_RETRIES = 3;
constexpr uint32_t ANALYTICS_INTERVAL_MS = 5000;

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * Immutable description of the file being uploaded.
 */
struct FileDescriptor {
    std::string name;
    int64_t size = 0;
    std::string mime_type;
};

/**
 * Per-job options fixed at enqueue time.
 */
struct UploadOptions {
    int64_t chunk_size = DEFAULT_CHUNK_SIZE;
    int max_concurrent_chunks = DEFAULT_MAX_CONCURRENT_CHUNKS;
    bool resumable = true;
    bool compute_chunk_hash = true;
    // Id of an earlier upload whose stored progress should be continued.
    std::optional<std::string> resume_token;
};

/**
 * One contiguous byte range of the file. uploaded never reverts to false.
 */
struct UploadChunk {
    uint32_t index = 0;
    int64_t start = 0;          // inclusive
    int64_t end = 0;            // exclusive
    int64_t size = 0;
    bool uploaded = false;
    std::string hash;           // hex SHA-256 once read, empty if not computed
};

/**
 * Point-in-time copy of a job, safe to hand to callers.
 */
struct UploadSnapshot {
    std::string id;
    FileDescriptor file;
    int priority = DEFAULT_PRIORITY;
    UploadStatus status = UploadStatus::QUEUED;
    int64_t chunk_size = DEFAULT_CHUNK_SIZE;
    int max_concurrent_chunks = DEFAULT_MAX_CONCURRENT_CHUNKS;
    bool resumable = true;
    bool paused = false;
    uint32_t total_chunks = 0;
    uint32_t uploaded_chunks = 0;
    int64_t bytes_uploaded = 0;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::string error;
    UploadErrorKind error_kind = UploadErrorKind::NONE;

    float progress_percent() const {
        if (file.size <= 0) return 0.0f;
        return static_cast<float>(bytes_uploaded) * 100.0f / static_cast<float>(file.size);
    }
};

/**
 * Durable per-upload progress.
 */
struct ResumeRecord {
    std::string upload_id;
    uint32_t total_chunks = 0;
    std::vector<uint32_t> completed_chunks;     // sorted, unique
    int64_t chunk_size = 0;
    std::string filename;
    int64_t updated_at_ms = 0;
};

struct QueueStatus {
    size_t queued = 0;
    size_t active = 0;
    size_t total = 0;
};

/**
 * Engine-wide analytics view.
 */
struct AnalyticsSnapshot {
    uint64_t total_uploads = 0;         // completed + failed
    uint64_t completed_uploads = 0;
    uint64_t failed_uploads = 0;
    int64_t total_bytes = 0;            // bytes accepted by the transport since start
    double average_speed = 0.0;         // bytes/sec over the elapsed time of active jobs
    double success_rate = 0.0;          // completed / total_uploads, in [0, 1]
    size_t active_uploads = 0;
    size_t queue_length = 0;
    double bandwidth_usage = 0.0;       // measured bytes/sec at the throttle
    uint64_t memory_usage = 0;          // resident set size in bytes
    std::chrono::system_clock::time_point updated_at;
};

#endif // UPLOAD_TYPES_H
