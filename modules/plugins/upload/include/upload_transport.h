#ifndef UPLOAD_TRANSPORT_H
#define UPLOAD_TRANSPORT_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * One chunk handed to the transport, tagged with its job and index.
 */
struct ChunkEnvelope {
    std::string upload_id;
    uint32_t chunk_index = 0;
    int64_t offset = 0;
    const std::vector<uint8_t>* data = nullptr;     // valid for the duration of send_chunk
    std::string sha256;                             // empty if hashing is disabled
};

/**
 * Destination for chunk payloads. send_chunk may be called concurrently for
 * different chunks of the same upload and for different uploads.
 */
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    /**
     * Deliver one chunk.
     * @param error Filled with a description on failure
     * @return true if the chunk was accepted
     */
    virtual bool send_chunk(const ChunkEnvelope& envelope, std::string& error) = 0;

    /**
     * Called once after every chunk of an upload has been accepted.
     */
    virtual bool finalize(const std::string& upload_id,
                          const std::string& file_name,
                          uint32_t total_chunks,
                          std::string& error) {
        (void)upload_id;
        (void)file_name;
        (void)total_chunks;
        (void)error;
        return true;
    }
};

using ChunkSendFunction = std::function<bool(const ChunkEnvelope& envelope, std::string& error)>;
using UploadFinalizeFunction = std::function<bool(const std::string& upload_id,
                                                  const std::string& file_name,
                                                  uint32_t total_chunks,
                                                  std::string& error)>;

/**
 * Adapts plain callables to UploadTransport.
 */
class CallbackTransport : public UploadTransport {
public:
    explicit CallbackTransport(ChunkSendFunction send, UploadFinalizeFunction finalize = nullptr);

    bool send_chunk(const ChunkEnvelope& envelope, std::string& error) override;
    bool finalize(const std::string& upload_id,
                  const std::string& file_name,
                  uint32_t total_chunks,
                  std::string& error) override;

private:
    ChunkSendFunction m_send;
    UploadFinalizeFunction m_finalize;
};

/**
 * Spools chunks into <root>/<upload_id>/<index>.chunk and assembles
 * <root>/<upload_id>/<file_name> on finalize. Chunk digests, when present,
 * are verified against the bytes written.
 */
class SpoolDirectoryTransport : public UploadTransport {
public:
    explicit SpoolDirectoryTransport(std::string root_dir);

    bool send_chunk(const ChunkEnvelope& envelope, std::string& error) override;
    bool finalize(const std::string& upload_id,
                  const std::string& file_name,
                  uint32_t total_chunks,
                  std::string& error) override;

    const std::string& root_dir() const { return m_root; }

    // Path of the assembled file for a finalized upload.
    std::string output_path(const std::string& upload_id, const std::string& file_name) const;

private:
    std::string chunk_path(const std::string& upload_id, uint32_t index) const;

    std::string m_root;
    std::mutex m_dir_mutex;
};

#endif // UPLOAD_TRANSPORT_H
