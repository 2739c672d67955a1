#pragma once

#include "upload_types.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Durable map of upload id -> completed chunk indices.
 */
class ResumeStore {
public:
    virtual ~ResumeStore() = default;

    virtual std::optional<ResumeRecord> get(const std::string& upload_id) = 0;

    /**
     * Add chunk_index to the record, creating it on first call. Recording an
     * index that is already present is a no-op that still returns true.
     * @return false if the change could not be made durable
     */
    virtual bool record_chunk_complete(const std::string& upload_id,
                                       uint32_t chunk_index,
                                       uint32_t total_chunks,
                                       int64_t chunk_size,
                                       const std::string& filename) = 0;

    virtual bool remove(const std::string& upload_id) = 0;

    virtual std::vector<ResumeRecord> list() = 0;
};

/**
 * JSON file-backed ResumeStore. The whole document is rewritten to
 * "<path>.tmp" and renamed over "<path>" on every change, so a crash leaves
 * either the previous or the new document on disk.
 *
 * Document layout:
 *   {"version":1,"uploads":[{"upload_id":..,"total_chunks":..,
 *     "completed_chunks":[..],"chunk_size":..,"filename":..,"updated_at_ms":..}]}
 */
class JsonFileResumeStore : public ResumeStore {
public:
    struct Options {
        std::string path;
        bool create_parent_dirs = true;
    };

    JsonFileResumeStore();
    ~JsonFileResumeStore() override;

    JsonFileResumeStore(const JsonFileResumeStore&) = delete;
    JsonFileResumeStore& operator=(const JsonFileResumeStore&) = delete;

    // Loads existing records. A missing or corrupt file opens as an empty store.
    bool open(const Options& options);
    void close();

    bool is_open() const;
    std::string path() const;

    std::optional<ResumeRecord> get(const std::string& upload_id) override;
    bool record_chunk_complete(const std::string& upload_id,
                               uint32_t chunk_index,
                               uint32_t total_chunks,
                               int64_t chunk_size,
                               const std::string& filename) override;
    bool remove(const std::string& upload_id) override;
    std::vector<ResumeRecord> list() override;

private:
    struct Impl;
    std::unique_ptr<Impl> m;
};

/**
 * Non-durable store, used when resumability is not wanted and in tests.
 */
class InMemoryResumeStore : public ResumeStore {
public:
    std::optional<ResumeRecord> get(const std::string& upload_id) override;
    bool record_chunk_complete(const std::string& upload_id,
                               uint32_t chunk_index,
                               uint32_t total_chunks,
                               int64_t chunk_size,
                               const std::string& filename) override;
    bool remove(const std::string& upload_id) override;
    std::vector<ResumeRecord> list() override;

private:
    std::mutex m_mutex;
    std::vector<ResumeRecord> m_records;
};
