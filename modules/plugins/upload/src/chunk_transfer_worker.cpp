#include "chunk_transfer_worker.h"
#include "chunk_hash.h"
#include "logger.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

ChunkTransferWorker::ChunkTransferWorker(std::shared_ptr<UploadTransport> transport,
                                         std::shared_ptr<ResumeStore> resume_store,
                                         std::shared_ptr<BandwidthThrottle> throttle,
                                         UploadEventBus& events,
                                         int persist_retries)
    : m_transport(std::move(transport)),
      m_resume_store(std::move(resume_store)),
      m_throttle(std::move(throttle)),
      m_events(events),
      m_persist_retries(std::max(1, persist_retries)) {}

ChunkTransferWorker::Result ChunkTransferWorker::transfer(UploadJob& job, uint32_t chunk_index) {
    Result result;

    UploadChunk chunk;
    uint32_t total_chunks = 0;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        if (chunk_index >= job.chunks.size()) {
            result.outcome = Outcome::FAILED;
            result.error_kind = UploadErrorKind::SOURCE_READ;
            result.error = "chunk index " + std::to_string(chunk_index) + " out of range";
            return result;
        }
        chunk = job.chunks[chunk_index];
        total_chunks = static_cast<uint32_t>(job.chunks.size());
    }
    if (chunk.uploaded) {
        result.outcome = Outcome::UPLOADED;
        return result;
    }

    if (job.cancel_requested.load()) {
        return result;
    }
    if (!m_throttle->acquire(chunk.size, [&job] { return job.cancel_requested.load(); })) {
        LOG_DEBUG("UE: Chunk " + std::to_string(chunk_index) + " of " + job.id + " dropped while throttled");
        return result;
    }

    std::vector<uint8_t> data;
    std::string read_error;
    bool read_ok = false;
    try {
        read_ok = job.source->read_range(chunk.start, chunk.size, data);
    } catch (const std::exception& e) {
        read_error = std::string(": source threw: ") + e.what();
        LOG_ERROR("UE: Source for " + job.id + " threw on chunk " + std::to_string(chunk_index) + ": " + e.what());
    }
    if (!read_ok) {
        result.outcome = Outcome::FAILED;
        result.error_kind = UploadErrorKind::SOURCE_READ;
        result.error = "cannot read " + std::to_string(chunk.size) + " bytes at offset " +
                       std::to_string(chunk.start) + read_error;
        return result;
    }

    ChunkEnvelope envelope;
    envelope.upload_id = job.id;
    envelope.chunk_index = chunk_index;
    envelope.offset = chunk.start;
    envelope.data = &data;
    if (job.options.compute_chunk_hash) {
        envelope.sha256 = sha256_hex(data);
    }

    std::string send_error;
    bool sent = false;
    try {
        sent = m_transport->send_chunk(envelope, send_error);
    } catch (const std::exception& e) {
        send_error = std::string("transport threw: ") + e.what();
        sent = false;
    }
    if (!sent) {
        result.outcome = Outcome::FAILED;
        result.error_kind = UploadErrorKind::TRANSPORT;
        result.error = "chunk " + std::to_string(chunk_index) + ": " +
                       (send_error.empty() ? std::string("transport rejected chunk") : send_error);
        return result;
    }

    m_throttle->record_sent(chunk.size);

    int64_t bytes_after = 0;
    job.mark_chunk_uploaded(chunk_index, envelope.sha256, &bytes_after);
    result.outcome = Outcome::UPLOADED;
    result.bytes_sent = chunk.size;

    if (job.options.resumable) {
        persist_progress(job, chunk, total_chunks);
    }

    UploadProgressEvent progress;
    progress.upload_id = job.id;
    progress.chunk_index = chunk_index;
    progress.bytes_uploaded = bytes_after;
    progress.total_bytes = job.file.size;
    progress.progress_percent = job.file.size > 0
        ? static_cast<float>(bytes_after) * 100.0f / static_cast<float>(job.file.size)
        : 0.0f;
    m_events.publish(progress);

    return result;
}

void ChunkTransferWorker::persist_progress(UploadJob& job, const UploadChunk& chunk, uint32_t total_chunks) {
    for (int attempt = 1; attempt <= m_persist_retries; ++attempt) {
        bool ok = false;
        try {
            ok = m_resume_store->record_chunk_complete(job.id, chunk.index, total_chunks,
                                                       job.options.chunk_size, job.file.name);
        } catch (const std::exception& e) {
            LOG_WARN("UE: Resume store threw for " + job.id + ": " + e.what());
        }
        if (ok) {
            return;
        }
        if (attempt < m_persist_retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * attempt));
        }
    }

    LOG_WARN("UE: Could not persist chunk " + std::to_string(chunk.index) + " of " + job.id +
             " after " + std::to_string(m_persist_retries) + " attempts");
    ResumeStoreWarningEvent warning;
    warning.upload_id = job.id;
    warning.chunk_index = chunk.index;
    warning.attempts = m_persist_retries;
    m_events.publish(warning);
}
