#include "upload_transport.h"
#include "chunk_hash.h"
#include "logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ============================================================================
// CallbackTransport
// ============================================================================

CallbackTransport::CallbackTransport(ChunkSendFunction send, UploadFinalizeFunction finalize)
    : m_send(std::move(send)), m_finalize(std::move(finalize)) {}

bool CallbackTransport::send_chunk(const ChunkEnvelope& envelope, std::string& error) {
    if (!m_send) {
        error = "no send callback installed";
        return false;
    }
    return m_send(envelope, error);
}

bool CallbackTransport::finalize(const std::string& upload_id,
                                 const std::string& file_name,
                                 uint32_t total_chunks,
                                 std::string& error) {
    if (!m_finalize) {
        return true;
    }
    return m_finalize(upload_id, file_name, total_chunks, error);
}

// ============================================================================
// SpoolDirectoryTransport
// ============================================================================

// Keeps only the final path component so a crafted name cannot escape the spool dir.
static std::string safe_file_name(const std::string& name) {
    std::string base = fs::path(name).filename().string();
    if (base.empty() || base == "." || base == "..") {
        return "upload.bin";
    }
    return base;
}

SpoolDirectoryTransport::SpoolDirectoryTransport(std::string root_dir)
    : m_root(std::move(root_dir)) {}

std::string SpoolDirectoryTransport::chunk_path(const std::string& upload_id, uint32_t index) const {
    return (fs::path(m_root) / upload_id / (std::to_string(index) + ".chunk")).string();
}

std::string SpoolDirectoryTransport::output_path(const std::string& upload_id,
                                                 const std::string& file_name) const {
    return (fs::path(m_root) / upload_id / safe_file_name(file_name)).string();
}

bool SpoolDirectoryTransport::send_chunk(const ChunkEnvelope& envelope, std::string& error) {
    if (!envelope.data) {
        error = "empty chunk envelope";
        return false;
    }

    if (!envelope.sha256.empty() && sha256_hex(*envelope.data) != envelope.sha256) {
        error = "digest mismatch for chunk " + std::to_string(envelope.chunk_index);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_dir_mutex);
        std::error_code ec;
        fs::create_directories(fs::path(m_root) / envelope.upload_id, ec);
        if (ec) {
            error = "cannot create spool directory: " + ec.message();
            return false;
        }
    }

    const std::string final_path = chunk_path(envelope.upload_id, envelope.chunk_index);
    const std::string part_path = final_path + ".part";
    {
        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "cannot open " + part_path;
            return false;
        }
        out.write(reinterpret_cast<const char*>(envelope.data->data()),
                  static_cast<std::streamsize>(envelope.data->size()));
        out.flush();
        if (!out) {
            error = "short write to " + part_path;
            std::remove(part_path.c_str());
            return false;
        }
    }

    if (std::rename(part_path.c_str(), final_path.c_str()) != 0) {
        error = "cannot rename " + part_path;
        std::remove(part_path.c_str());
        return false;
    }

    LOG_DEBUG("SPOOL: Stored chunk " + std::to_string(envelope.chunk_index) +
              " of " + envelope.upload_id + " (" + std::to_string(envelope.data->size()) + " bytes)");
    return true;
}

bool SpoolDirectoryTransport::finalize(const std::string& upload_id,
                                       const std::string& file_name,
                                       uint32_t total_chunks,
                                       std::string& error) {
    const std::string target = output_path(upload_id, file_name);
    const std::string part_target = target + ".part";

    {
        std::ofstream out(part_target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "cannot open " + part_target;
            return false;
        }

        std::vector<char> buf(64 * 1024);
        for (uint32_t i = 0; i < total_chunks; ++i) {
            std::ifstream in(chunk_path(upload_id, i), std::ios::binary);
            if (!in.is_open()) {
                error = "missing chunk " + std::to_string(i) + " of " + upload_id;
                out.close();
                std::remove(part_target.c_str());
                return false;
            }
            while (in) {
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                const auto n = in.gcount();
                if (n > 0) out.write(buf.data(), n);
            }
        }
        out.flush();
        if (!out) {
            error = "short write to " + part_target;
            std::remove(part_target.c_str());
            return false;
        }
    }

    if (std::rename(part_target.c_str(), target.c_str()) != 0) {
        error = "cannot rename " + part_target;
        std::remove(part_target.c_str());
        return false;
    }

    for (uint32_t i = 0; i < total_chunks; ++i) {
        std::error_code ec;
        fs::remove(chunk_path(upload_id, i), ec);
    }

    LOG_INFO("SPOOL: Assembled " + target + " from " + std::to_string(total_chunks) + " chunks");
    return true;
}
