#include "single_shot_uploader.h"
#include "chunk_hash.h"
#include "logger.h"

#include <vector>

TransportSingleShotUploader::TransportSingleShotUploader(std::shared_ptr<UploadTransport> transport,
                                                         bool compute_hash)
    : m_transport(std::move(transport)), m_compute_hash(compute_hash) {}

bool TransportSingleShotUploader::upload(const std::string& upload_id,
                                         const FileDescriptor& file,
                                         SourceReader& source,
                                         std::string& error) {
    if (!m_transport) {
        error = "no transport";
        return false;
    }

    std::vector<uint8_t> data;
    if (!source.read_range(0, file.size, data)) {
        error = "cannot read " + std::to_string(file.size) + " bytes from source";
        return false;
    }

    ChunkEnvelope envelope;
    envelope.upload_id = upload_id;
    envelope.chunk_index = 0;
    envelope.offset = 0;
    envelope.data = &data;
    if (m_compute_hash) {
        envelope.sha256 = sha256_hex(data);
    }

    if (!m_transport->send_chunk(envelope, error)) {
        if (error.empty()) error = "transport rejected payload";
        return false;
    }
    if (!m_transport->finalize(upload_id, file.name, 1, error)) {
        if (error.empty()) error = "finalize failed";
        return false;
    }

    LOG_DEBUG("UE: Single-shot upload of " + file.name + " (" + std::to_string(file.size) + " bytes) done");
    return true;
}
