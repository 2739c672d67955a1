#ifndef SOURCE_READER_H
#define SOURCE_READER_H

#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Random-access byte source for an upload. Chunk workers of one job call
 * read_range concurrently, so implementations must be thread-safe.
 */
class SourceReader {
public:
    virtual ~SourceReader() = default;

    virtual int64_t size() const = 0;

    /**
     * Read exactly len bytes starting at offset into out (resized to len).
     * @return false if the range cannot be delivered in full
     */
    virtual bool read_range(int64_t offset, int64_t len, std::vector<uint8_t>& out) = 0;
};

/**
 * In-memory buffer source.
 */
class MemorySourceReader : public SourceReader {
public:
    explicit MemorySourceReader(std::vector<uint8_t> data);

    int64_t size() const override;
    bool read_range(int64_t offset, int64_t len, std::vector<uint8_t>& out) override;

private:
    const std::vector<uint8_t> m_data;
};

/**
 * Seekable stream source. Reads are serialized because seekg/read share the
 * stream position.
 */
class StreamSourceReader : public SourceReader {
public:
    explicit StreamSourceReader(std::unique_ptr<std::istream> stream);

    int64_t size() const override;
    bool read_range(int64_t offset, int64_t len, std::vector<uint8_t>& out) override;

private:
    std::unique_ptr<std::istream> m_stream;
    int64_t m_size = 0;
    std::mutex m_mutex;
};

// MIME type from the file extension (case-insensitive), application/octet-stream if unknown.
std::string guess_mime_type(const std::string& path);

// Opens a file in binary mode. Returns nullptr (and logs) if it cannot be opened.
std::shared_ptr<SourceReader> open_file_source(const std::string& path);

#endif // SOURCE_READER_H
