#include "chunk_planner.h"
#include <algorithm>

uint32_t ChunkPlanner::chunk_count(int64_t file_size, int64_t chunk_size) {
    if (file_size <= 0 || chunk_size <= 0) {
        return 0;
    }
    return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

std::vector<UploadChunk> ChunkPlanner::plan(int64_t file_size,
                                            int64_t chunk_size,
                                            const std::vector<uint32_t>& completed_indices) {
    std::vector<UploadChunk> chunks;
    const uint32_t total = chunk_count(file_size, chunk_size);
    if (total == 0) {
        return chunks;
    }

    chunks.reserve(total);
    for (uint32_t i = 0; i < total; ++i) {
        UploadChunk chunk;
        chunk.index = i;
        chunk.start = static_cast<int64_t>(i) * chunk_size;
        chunk.end = std::min(chunk.start + chunk_size, file_size);
        chunk.size = chunk.end - chunk.start;
        chunks.push_back(chunk);
    }

    for (uint32_t idx : completed_indices) {
        if (idx < total) {
            chunks[idx].uploaded = true;
        }
    }
    return chunks;
}

int64_t ChunkPlanner::uploaded_bytes(const std::vector<UploadChunk>& chunks) {
    int64_t total = 0;
    for (const auto& chunk : chunks) {
        if (chunk.uploaded) total += chunk.size;
    }
    return total;
}

std::vector<uint32_t> ChunkPlanner::pending_indices(const std::vector<UploadChunk>& chunks) {
    std::vector<uint32_t> pending;
    for (const auto& chunk : chunks) {
        if (!chunk.uploaded) pending.push_back(chunk.index);
    }
    return pending;
}
