#ifndef CHUNK_TRANSFER_WORKER_H
#define CHUNK_TRANSFER_WORKER_H

#include "bandwidth_throttle.h"
#include "resume_store.h"
#include "upload_event_bus.h"
#include "upload_job.h"
#include "upload_transport.h"

#include <memory>
#include <string>

/**
 * Uploads a single chunk of a job:
 * throttle -> read range -> hash -> send -> mark uploaded -> persist progress.
 *
 * Stateless apart from its collaborators; one instance is shared by every
 * chunk thread of every job.
 */
class ChunkTransferWorker {
public:
    enum class Outcome {
        UPLOADED,   // accepted by the transport
        FAILED,     // transport or source failure, job must fail
        ABORTED     // job cancelled before the chunk was sent
    };

    struct Result {
        Outcome outcome = Outcome::ABORTED;
        UploadErrorKind error_kind = UploadErrorKind::NONE;
        std::string error;
        int64_t bytes_sent = 0;
    };

    ChunkTransferWorker(std::shared_ptr<UploadTransport> transport,
                        std::shared_ptr<ResumeStore> resume_store,
                        std::shared_ptr<BandwidthThrottle> throttle,
                        UploadEventBus& events,
                        int persist_retries);

    Result transfer(UploadJob& job, uint32_t chunk_index);

private:
    // Records the chunk in the resume store, retrying up to m_persist_retries times.
    void persist_progress(UploadJob& job, const UploadChunk& chunk, uint32_t total_chunks);

    std::shared_ptr<UploadTransport> m_transport;
    std::shared_ptr<ResumeStore> m_resume_store;
    std::shared_ptr<BandwidthThrottle> m_throttle;
    UploadEventBus& m_events;
    int m_persist_retries;
};

#endif // CHUNK_TRANSFER_WORKER_H
