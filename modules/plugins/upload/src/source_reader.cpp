#include "source_reader.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>

// ============================================================================
// MemorySourceReader
// ============================================================================

MemorySourceReader::MemorySourceReader(std::vector<uint8_t> data)
    : m_data(std::move(data)) {}

int64_t MemorySourceReader::size() const {
    return static_cast<int64_t>(m_data.size());
}

bool MemorySourceReader::read_range(int64_t offset, int64_t len, std::vector<uint8_t>& out) {
    if (offset < 0 || len < 0 || offset + len > size()) {
        return false;
    }
    out.resize(static_cast<size_t>(len));
    if (len > 0) {
        std::memcpy(out.data(), m_data.data() + offset, static_cast<size_t>(len));
    }
    return true;
}

// ============================================================================
// StreamSourceReader
// ============================================================================

StreamSourceReader::StreamSourceReader(std::unique_ptr<std::istream> stream)
    : m_stream(std::move(stream)) {
    if (m_stream && *m_stream) {
        m_stream->seekg(0, std::ios::end);
        const auto end = m_stream->tellg();
        m_size = end >= 0 ? static_cast<int64_t>(end) : 0;
        m_stream->seekg(0, std::ios::beg);
    }
}

int64_t StreamSourceReader::size() const {
    return m_size;
}

bool StreamSourceReader::read_range(int64_t offset, int64_t len, std::vector<uint8_t>& out) {
    if (offset < 0 || len < 0 || offset + len > m_size) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_stream) {
        return false;
    }
    m_stream->clear();
    m_stream->seekg(offset, std::ios::beg);
    if (!*m_stream) {
        return false;
    }

    out.resize(static_cast<size_t>(len));
    if (len == 0) {
        return true;
    }
    m_stream->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(len));
    return m_stream->gcount() == static_cast<std::streamsize>(len);
}

std::shared_ptr<SourceReader> open_file_source(const std::string& path) {
    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!stream->is_open()) {
        LOG_WARN("SRC: Cannot open source file " + path);
        return nullptr;
    }
    return std::make_shared<StreamSourceReader>(std::move(stream));
}

std::string guess_mime_type(const std::string& path) {
    static const std::map<std::string, std::string> types = {
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
        {".gif", "image/gif"}, {".webp", "image/webp"}, {".mp4", "video/mp4"},
        {".mov", "video/quicktime"}, {".mp3", "audio/mpeg"}, {".ogg", "audio/ogg"},
        {".pdf", "application/pdf"}, {".txt", "text/plain"}, {".json", "application/json"},
        {".zip", "application/zip"}
    };
    std::string ext = std::filesystem::path(path).extension().string();
    for (auto& c : ext) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}
