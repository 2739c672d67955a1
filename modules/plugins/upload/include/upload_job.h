#ifndef UPLOAD_JOB_H
#define UPLOAD_JOB_H

#include "source_reader.h"
#include "upload_types.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * State of one file transfer. Identity, file, priority and options are fixed
 * at construction; everything else is guarded by mutex.
 */
struct UploadJob {
    UploadJob(std::string job_id,
              FileDescriptor file_desc,
              int job_priority,
              UploadOptions job_options,
              std::shared_ptr<SourceReader> job_source);

    const std::string id;
    const FileDescriptor file;
    const int priority;
    const UploadOptions options;
    const std::shared_ptr<SourceReader> source;

    // Set when the caller pauses or cancels an active job; read by chunk workers
    // between chunks.
    std::atomic<bool> cancel_requested{false};

    mutable std::mutex mutex;
    UploadStatus status = UploadStatus::QUEUED;
    std::vector<UploadChunk> chunks;
    int64_t bytes_uploaded = 0;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::chrono::steady_clock::time_point started_at;
    std::string error;
    UploadErrorKind error_kind = UploadErrorKind::NONE;
    bool paused = false;
    uint32_t resumed_chunks = 0;

    bool is_chunked() const { return file.size > options.chunk_size; }

    /**
     * Mark a chunk uploaded and add its size to bytes_uploaded in one step.
     * @param bytes_after Receives bytes_uploaded after the update
     * @return false if the chunk was already marked (nothing added)
     */
    bool mark_chunk_uploaded(uint32_t index, const std::string& hash, int64_t* bytes_after);

    UploadSnapshot snapshot() const;
};

#endif // UPLOAD_JOB_H
