/**
 * resume_store.cpp
 * JSON file and in-memory implementations of upload progress persistence.
 */

#include "resume_store.h"
#include "logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <unordered_map>

using json = nlohmann::json;

// ============================================================================
// Helpers
// ============================================================================

static int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Inserts index keeping the vector sorted. Returns false if it was already present.
static bool insert_sorted_unique(std::vector<uint32_t>& indices, uint32_t index) {
    auto it = std::lower_bound(indices.begin(), indices.end(), index);
    if (it != indices.end() && *it == index) {
        return false;
    }
    indices.insert(it, index);
    return true;
}

static json record_to_json(const ResumeRecord& r) {
    json j;
    j["upload_id"] = r.upload_id;
    j["total_chunks"] = r.total_chunks;
    j["completed_chunks"] = r.completed_chunks;
    j["chunk_size"] = r.chunk_size;
    j["filename"] = r.filename;
    j["updated_at_ms"] = r.updated_at_ms;
    return j;
}

static bool record_from_json(const json& j, ResumeRecord& out) {
    if (!j.is_object()) return false;
    // Negative or oversized counts would wrap when narrowed
    auto total = j.find("total_chunks");
    if (total == j.end() || !total->is_number_unsigned() ||
        total->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    out.upload_id = j.value("upload_id", "");
    out.total_chunks = total->get<uint32_t>();
    out.chunk_size = j.value("chunk_size", static_cast<int64_t>(0));
    out.filename = j.value("filename", "");
    out.updated_at_ms = j.value("updated_at_ms", static_cast<int64_t>(0));
    out.completed_chunks.clear();

    auto it = j.find("completed_chunks");
    if (it != j.end() && it->is_array()) {
        for (const auto& v : *it) {
            if (!v.is_number_unsigned()) continue;
            const auto idx = v.get<uint64_t>();
            if (idx < out.total_chunks) {
                insert_sorted_unique(out.completed_chunks, static_cast<uint32_t>(idx));
            }
        }
    }
    return !out.upload_id.empty() && out.total_chunks > 0;
}

// ============================================================================
// JsonFileResumeStore::Impl
// ============================================================================

struct JsonFileResumeStore::Impl {
    Impl() = default;
    ~Impl() { close(); }

    bool open(const Options& opts);
    void close();
    bool is_open() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_is_open;
    }
    std::string path() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_path;
    }

    std::optional<ResumeRecord> get(const std::string& upload_id);
    bool record_chunk_complete(const std::string& upload_id,
                               uint32_t chunk_index,
                               uint32_t total_chunks,
                               int64_t chunk_size,
                               const std::string& filename);
    bool remove(const std::string& upload_id);
    std::vector<ResumeRecord> list();

private:
    bool load();
    bool save_atomic();

    std::string m_path;
    bool m_is_open = false;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, ResumeRecord> m_records;
};

bool JsonFileResumeStore::Impl::open(const Options& opts) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_is_open) {
        return true;
    }
    if (opts.path.empty()) {
        LOG_WARN("RS: Refusing to open resume store without a path");
        return false;
    }

    m_path = opts.path;
    if (opts.create_parent_dirs) {
        const auto parent = std::filesystem::path(m_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                LOG_WARN("RS: Cannot create " + parent.string() + ": " + ec.message());
            }
        }
    }

    load();  // Missing file is not an error

    m_is_open = true;
    LOG_INFO("RS: Opened resume store at " + m_path +
             " (" + std::to_string(m_records.size()) + " records loaded)");
    return true;
}

void JsonFileResumeStore::Impl::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_is_open) {
        return;
    }
    m_records.clear();
    m_is_open = false;
    LOG_DEBUG("RS: Closed " + m_path);
}

bool JsonFileResumeStore::Impl::load() {
    // Called with mutex held
    std::ifstream ifs(m_path);
    if (!ifs.is_open()) {
        LOG_DEBUG("RS: No existing file at " + m_path);
        return false;
    }

    json j = json::parse(ifs, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("uploads") || !j["uploads"].is_array()) {
        LOG_WARN("RS: Ignoring unreadable resume file " + m_path);
        return false;
    }

    m_records.clear();
    for (const auto& entry : j["uploads"]) {
        ResumeRecord record;
        try {
            if (record_from_json(entry, record)) {
                m_records[record.upload_id] = std::move(record);
            }
        } catch (const json::exception& e) {
            LOG_WARN("RS: Skipping malformed record: " + std::string(e.what()));
        }
    }
    return true;
}

bool JsonFileResumeStore::Impl::save_atomic() {
    // Called with mutex held
    const std::string tmp_path = m_path + ".tmp";

    json j;
    j["version"] = 1;
    j["uploads"] = json::array();
    for (const auto& kv : m_records) {
        j["uploads"].push_back(record_to_json(kv.second));
    }

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs.is_open()) {
        LOG_ERROR("RS: Cannot write temp file " + tmp_path);
        return false;
    }
    ofs << j.dump(2);
    ofs.close();
    if (ofs.fail()) {
        LOG_ERROR("RS: Failed to write temp file " + tmp_path);
        std::remove(tmp_path.c_str());
        return false;
    }

    if (std::rename(tmp_path.c_str(), m_path.c_str()) != 0) {
        LOG_ERROR("RS: Failed to rename temp file to " + m_path);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

std::optional<ResumeRecord> JsonFileResumeStore::Impl::get(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(upload_id);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonFileResumeStore::Impl::record_chunk_complete(const std::string& upload_id,
                                                      uint32_t chunk_index,
                                                      uint32_t total_chunks,
                                                      int64_t chunk_size,
                                                      const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_is_open) {
        LOG_WARN("RS: record_chunk_complete on closed store");
        return false;
    }
    if (chunk_index >= total_chunks) {
        LOG_WARN("RS: Chunk index " + std::to_string(chunk_index) + " out of range for " + upload_id);
        return false;
    }

    auto it = m_records.find(upload_id);
    const bool existed = it != m_records.end();
    ResumeRecord previous;
    if (existed) {
        if (std::binary_search(it->second.completed_chunks.begin(),
                               it->second.completed_chunks.end(), chunk_index)) {
            return true;
        }
        previous = it->second;
    } else {
        ResumeRecord fresh;
        fresh.upload_id = upload_id;
        fresh.total_chunks = total_chunks;
        fresh.chunk_size = chunk_size;
        fresh.filename = filename;
        it = m_records.emplace(upload_id, std::move(fresh)).first;
    }

    insert_sorted_unique(it->second.completed_chunks, chunk_index);
    it->second.updated_at_ms = now_ms();

    if (!save_atomic()) {
        // Roll back so a retry performs the write again.
        if (existed) {
            it->second = std::move(previous);
        } else {
            m_records.erase(it);
        }
        return false;
    }
    return true;
}

bool JsonFileResumeStore::Impl::remove(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_is_open) {
        return false;
    }
    auto it = m_records.find(upload_id);
    if (it == m_records.end()) {
        return true;
    }
    ResumeRecord previous = std::move(it->second);
    m_records.erase(it);
    if (!save_atomic()) {
        m_records.emplace(upload_id, std::move(previous));
        return false;
    }
    LOG_DEBUG("RS: Removed record " + upload_id);
    return true;
}

std::vector<ResumeRecord> JsonFileResumeStore::Impl::list() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ResumeRecord> out;
    out.reserve(m_records.size());
    for (const auto& kv : m_records) {
        out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const ResumeRecord& a, const ResumeRecord& b) {
        return a.upload_id < b.upload_id;
    });
    return out;
}

// ============================================================================
// JsonFileResumeStore
// ============================================================================

JsonFileResumeStore::JsonFileResumeStore() : m(std::make_unique<Impl>()) {}
JsonFileResumeStore::~JsonFileResumeStore() = default;

bool JsonFileResumeStore::open(const Options& options) { return m->open(options); }
void JsonFileResumeStore::close() { m->close(); }
bool JsonFileResumeStore::is_open() const { return m->is_open(); }
std::string JsonFileResumeStore::path() const { return m->path(); }

std::optional<ResumeRecord> JsonFileResumeStore::get(const std::string& upload_id) {
    return m->get(upload_id);
}

bool JsonFileResumeStore::record_chunk_complete(const std::string& upload_id,
                                                uint32_t chunk_index,
                                                uint32_t total_chunks,
                                                int64_t chunk_size,
                                                const std::string& filename) {
    return m->record_chunk_complete(upload_id, chunk_index, total_chunks, chunk_size, filename);
}

bool JsonFileResumeStore::remove(const std::string& upload_id) { return m->remove(upload_id); }
std::vector<ResumeRecord> JsonFileResumeStore::list() { return m->list(); }

// ============================================================================
// InMemoryResumeStore
// ============================================================================

std::optional<ResumeRecord> InMemoryResumeStore::get(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& r : m_records) {
        if (r.upload_id == upload_id) return r;
    }
    return std::nullopt;
}

bool InMemoryResumeStore::record_chunk_complete(const std::string& upload_id,
                                                uint32_t chunk_index,
                                                uint32_t total_chunks,
                                                int64_t chunk_size,
                                                const std::string& filename) {
    if (chunk_index >= total_chunks) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& r : m_records) {
        if (r.upload_id == upload_id) {
            if (insert_sorted_unique(r.completed_chunks, chunk_index)) {
                r.updated_at_ms = now_ms();
            }
            return true;
        }
    }
    ResumeRecord fresh;
    fresh.upload_id = upload_id;
    fresh.total_chunks = total_chunks;
    fresh.chunk_size = chunk_size;
    fresh.filename = filename;
    fresh.completed_chunks.push_back(chunk_index);
    fresh.updated_at_ms = now_ms();
    m_records.push_back(std::move(fresh));
    return true;
}

bool InMemoryResumeStore::remove(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.erase(std::remove_if(m_records.begin(), m_records.end(),
                                   [&](const ResumeRecord& r) { return r.upload_id == upload_id; }),
                    m_records.end());
    return true;
}

std::vector<ResumeRecord> InMemoryResumeStore::list() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}
