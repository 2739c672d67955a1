#include "chunk_hash.h"
#include "chunk_planner.h"
#include "logger.h"
#include "source_reader.h"

#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_exact_multiple() {
    auto chunks = ChunkPlanner::plan(4096, 1024);
    TEST_ASSERT(chunks.size() == 4, "4096/1024 should give 4 chunks");
    for (uint32_t i = 0; i < chunks.size(); ++i) {
        TEST_ASSERT(chunks[i].index == i, "index mismatch");
        TEST_ASSERT(chunks[i].start == static_cast<int64_t>(i) * 1024, "start mismatch");
        TEST_ASSERT(chunks[i].size == 1024, "every chunk should be full");
        TEST_ASSERT(!chunks[i].uploaded, "fresh chunk marked uploaded");
    }
    TEST_ASSERT(chunks.back().end == 4096, "last chunk must end at file size");
    return true;
}

static bool test_remainder_chunk() {
    // 2.5 MiB file with 1 MiB chunks
    const int64_t mib = 1024 * 1024;
    auto chunks = ChunkPlanner::plan(5 * mib / 2, mib);
    TEST_ASSERT(chunks.size() == 3, "2.5 MiB should give 3 chunks");
    TEST_ASSERT(chunks[2].start == 2 * mib, "last chunk start");
    TEST_ASSERT(chunks[2].size == mib / 2, "last chunk holds the remainder");

    int64_t covered = 0;
    int64_t expected_start = 0;
    for (const auto& c : chunks) {
        TEST_ASSERT(c.start == expected_start, "chunks must be contiguous");
        TEST_ASSERT(c.end - c.start == c.size, "size must equal end - start");
        expected_start = c.end;
        covered += c.size;
    }
    TEST_ASSERT(covered == 5 * mib / 2, "chunks must cover the whole file");
    return true;
}

static bool test_small_and_degenerate() {
    auto one = ChunkPlanner::plan(100, 1024);
    TEST_ASSERT(one.size() == 1, "file smaller than a chunk gives one chunk");
    TEST_ASSERT(one[0].size == 100, "single chunk size");

    auto single_byte_chunks = ChunkPlanner::plan(3, 1);
    TEST_ASSERT(single_byte_chunks.size() == 3, "chunk_size 1 gives one chunk per byte");

    TEST_ASSERT(ChunkPlanner::plan(0, 1024).empty(), "empty file gives no chunks");
    TEST_ASSERT(ChunkPlanner::plan(100, 0).empty(), "zero chunk size gives no chunks");
    TEST_ASSERT(ChunkPlanner::chunk_count(-5, 10) == 0, "negative size gives zero count");
    TEST_ASSERT(ChunkPlanner::chunk_count(10, 3) == 4, "ceil(10/3) == 4");
    return true;
}

static bool test_premarked_indices() {
    auto chunks = ChunkPlanner::plan(2500, 1000, {0, 2, 7});
    TEST_ASSERT(chunks.size() == 3, "chunk count");
    TEST_ASSERT(chunks[0].uploaded, "chunk 0 should be pre-marked");
    TEST_ASSERT(!chunks[1].uploaded, "chunk 1 should be pending");
    TEST_ASSERT(chunks[2].uploaded, "chunk 2 should be pre-marked");

    // Last chunk is short, so pre-marked bytes are not completed * chunk_size
    TEST_ASSERT(ChunkPlanner::uploaded_bytes(chunks) == 1500, "uploaded bytes must be exact");

    auto pending = ChunkPlanner::pending_indices(chunks);
    TEST_ASSERT(pending.size() == 1 && pending[0] == 1, "only chunk 1 pending");
    return true;
}

static bool test_memory_source_ranges() {
    std::vector<uint8_t> data(10);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i);
    MemorySourceReader reader(data);

    std::vector<uint8_t> out;
    TEST_ASSERT(reader.size() == 10, "memory source size");
    TEST_ASSERT(reader.read_range(4, 3, out), "in-range read");
    TEST_ASSERT(out.size() == 3 && out[0] == 4 && out[2] == 6, "read content");
    TEST_ASSERT(!reader.read_range(8, 5, out), "read past end must fail");
    TEST_ASSERT(!reader.read_range(-1, 2, out), "negative offset must fail");
    return true;
}

static bool test_stream_source_ranges() {
    auto stream = std::make_unique<std::istringstream>(std::string("abcdefghij"));
    StreamSourceReader reader(std::move(stream));

    std::vector<uint8_t> out;
    TEST_ASSERT(reader.size() == 10, "stream source size");
    TEST_ASSERT(reader.read_range(7, 3, out), "tail read");
    TEST_ASSERT(std::string(out.begin(), out.end()) == "hij", "tail content");
    TEST_ASSERT(reader.read_range(0, 2, out), "re-read from start after tail");
    TEST_ASSERT(std::string(out.begin(), out.end()) == "ab", "head content");
    TEST_ASSERT(!reader.read_range(9, 2, out), "short read must fail");
    return true;
}

static bool test_mime_type_guess() {
    TEST_ASSERT(guess_mime_type("holiday.jpg") == "image/jpeg", "lower-case extension");
    TEST_ASSERT(guess_mime_type("/tmp/CLIP.MOV") == "video/quicktime", "upper-case extension");
    TEST_ASSERT(guess_mime_type("notes") == "application/octet-stream", "no extension");
    // Bytes above 0x7f must not be passed to tolower as negative values
    TEST_ASSERT(guess_mime_type("caf\xc3\xa9.\xc3\x89t\xc3\xa9") == "application/octet-stream",
                "non-ASCII extension");
    TEST_ASSERT(guess_mime_type("\xff\xfe.PDF") == "application/pdf", "non-ASCII stem");
    return true;
}

static bool test_hash_and_ids() {
    // SHA-256("abc")
    const std::string abc = "abc";
    const std::string digest = sha256_hex(reinterpret_cast<const uint8_t*>(abc.data()), abc.size());
    TEST_ASSERT(digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                "sha256(abc) mismatch: " + digest);

    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        const std::string id = generate_upload_id();
        TEST_ASSERT(id.size() == 36, "id must be 36 chars");
        TEST_ASSERT(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-', "id dash layout");
        TEST_ASSERT(id[14] == '4', "version nibble must be 4");
        ids.insert(id);
    }
    TEST_ASSERT(ids.size() == 100, "ids must be unique");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);

    std::cout << "--- ChunkPlanner tests ---" << std::endl;

    if (test_exact_multiple()) std::cout << "PASS: exact multiple" << std::endl;
    if (test_remainder_chunk()) std::cout << "PASS: remainder chunk" << std::endl;
    if (test_small_and_degenerate()) std::cout << "PASS: small and degenerate sizes" << std::endl;
    if (test_premarked_indices()) std::cout << "PASS: pre-marked indices" << std::endl;
    if (test_memory_source_ranges()) std::cout << "PASS: memory source ranges" << std::endl;
    if (test_stream_source_ranges()) std::cout << "PASS: stream source ranges" << std::endl;
    if (test_mime_type_guess()) std::cout << "PASS: mime type guess" << std::endl;
    if (test_hash_and_ids()) std::cout << "PASS: sha256 and upload ids" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
