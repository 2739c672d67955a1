#ifndef SINGLE_SHOT_UPLOADER_H
#define SINGLE_SHOT_UPLOADER_H

#include "source_reader.h"
#include "upload_transport.h"
#include "upload_types.h"

#include <memory>
#include <string>

/**
 * Non-chunked path for files no larger than one chunk.
 */
class SingleShotUploader {
public:
    virtual ~SingleShotUploader() = default;

    /**
     * Upload the whole file in one call.
     * @param error Filled with a description on failure
     * @return true on success
     */
    virtual bool upload(const std::string& upload_id,
                        const FileDescriptor& file,
                        SourceReader& source,
                        std::string& error) = 0;
};

/**
 * Sends the whole payload through an UploadTransport as chunk 0 and finalizes
 * with a chunk count of one.
 */
class TransportSingleShotUploader : public SingleShotUploader {
public:
    explicit TransportSingleShotUploader(std::shared_ptr<UploadTransport> transport,
                                         bool compute_hash = true);

    bool upload(const std::string& upload_id,
                const FileDescriptor& file,
                SourceReader& source,
                std::string& error) override;

private:
    std::shared_ptr<UploadTransport> m_transport;
    bool m_compute_hash;
};

#endif // SINGLE_SHOT_UPLOADER_H
