#include "upload_job.h"

UploadJob::UploadJob(std::string job_id,
                     FileDescriptor file_desc,
                     int job_priority,
                     UploadOptions job_options,
                     std::shared_ptr<SourceReader> job_source)
    : id(std::move(job_id)),
      file(std::move(file_desc)),
      priority(job_priority),
      options(std::move(job_options)),
      source(std::move(job_source)) {}

bool UploadJob::mark_chunk_uploaded(uint32_t index, const std::string& hash, int64_t* bytes_after) {
    std::lock_guard<std::mutex> lock(mutex);
    if (index >= chunks.size()) {
        if (bytes_after) *bytes_after = bytes_uploaded;
        return false;
    }
    UploadChunk& chunk = chunks[index];
    const bool changed = !chunk.uploaded;
    if (changed) {
        chunk.uploaded = true;
        chunk.hash = hash;
        bytes_uploaded += chunk.size;
    }
    if (bytes_after) *bytes_after = bytes_uploaded;
    return changed;
}

UploadSnapshot UploadJob::snapshot() const {
    UploadSnapshot snap;
    snap.id = id;
    snap.file = file;
    snap.priority = priority;
    snap.chunk_size = options.chunk_size;
    snap.max_concurrent_chunks = options.max_concurrent_chunks;
    snap.resumable = options.resumable;

    std::lock_guard<std::mutex> lock(mutex);
    snap.status = status;
    snap.paused = paused;
    snap.total_chunks = static_cast<uint32_t>(chunks.size());
    for (const auto& chunk : chunks) {
        if (chunk.uploaded) ++snap.uploaded_chunks;
    }
    snap.bytes_uploaded = bytes_uploaded;
    snap.start_time = start_time;
    snap.end_time = end_time;
    snap.error = error;
    snap.error_kind = error_kind;
    return snap;
}
