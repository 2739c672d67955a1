#ifndef CHUNK_PLANNER_H
#define CHUNK_PLANNER_H

#include "upload_types.h"
#include <cstdint>
#include <vector>

/**
 * Splits a file into contiguous, non-overlapping byte ranges.
 *
 * total = ceil(file_size / chunk_size). Every chunk but the last has exactly
 * chunk_size bytes; the last holds the remainder.
 */
class ChunkPlanner {
public:
    static uint32_t chunk_count(int64_t file_size, int64_t chunk_size);

    /**
     * Build the chunk list. Indices listed in completed_indices are pre-marked
     * as uploaded; indices outside [0, total) are ignored.
     * @return empty vector if file_size or chunk_size is not positive
     */
    static std::vector<UploadChunk> plan(int64_t file_size,
                                         int64_t chunk_size,
                                         const std::vector<uint32_t>& completed_indices = {});

    // Sum of the sizes of chunks marked uploaded.
    static int64_t uploaded_bytes(const std::vector<UploadChunk>& chunks);

    // Indices not yet uploaded, ascending.
    static std::vector<uint32_t> pending_indices(const std::vector<UploadChunk>& chunks);
};

#endif // CHUNK_PLANNER_H
