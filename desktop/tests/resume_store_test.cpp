#include "logger.h"
#include "resume_store.h"

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
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

static std::filesystem::path fresh_path(const std::filesystem::path& workdir, const std::string& name) {
    const auto p = workdir / name;
    std::error_code ec;
    std::filesystem::remove(p, ec);
    std::filesystem::remove(p.string() + ".tmp", ec);
    return p;
}

static bool open_store(JsonFileResumeStore& store, const std::filesystem::path& p) {
    JsonFileResumeStore::Options opts;
    opts.path = p.string();
    return store.open(opts);
}

static bool test_record_and_get(const std::filesystem::path& workdir) {
    const auto p = fresh_path(workdir, "record_get.json");
    JsonFileResumeStore store;
    TEST_ASSERT(open_store(store, p), "open failed");
    TEST_ASSERT(!store.get("u1").has_value(), "empty store should have no record");

    TEST_ASSERT(store.record_chunk_complete("u1", 2, 5, 1024, "a.bin"), "record chunk 2");
    TEST_ASSERT(store.record_chunk_complete("u1", 0, 5, 1024, "a.bin"), "record chunk 0");

    auto rec = store.get("u1");
    TEST_ASSERT(rec.has_value(), "record missing");
    TEST_ASSERT(rec->total_chunks == 5, "total_chunks");
    TEST_ASSERT(rec->chunk_size == 1024, "chunk_size");
    TEST_ASSERT(rec->filename == "a.bin", "filename");
    TEST_ASSERT((rec->completed_chunks == std::vector<uint32_t>{0, 2}), "completed chunks sorted");
    TEST_ASSERT(rec->updated_at_ms > 0, "updated_at_ms set");
    TEST_ASSERT(std::filesystem::exists(p), "file written");
    TEST_ASSERT(!std::filesystem::exists(p.string() + ".tmp"), "temp file left behind");
    return true;
}

static bool test_idempotent_record(const std::filesystem::path& workdir) {
    const auto p = fresh_path(workdir, "idempotent.json");
    JsonFileResumeStore store;
    TEST_ASSERT(open_store(store, p), "open failed");

    TEST_ASSERT(store.record_chunk_complete("u1", 1, 3, 10, "f"), "first record");
    const auto first = store.get("u1");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    TEST_ASSERT(store.record_chunk_complete("u1", 1, 3, 10, "f"), "duplicate record returns true");
    const auto second = store.get("u1");

    TEST_ASSERT(second->completed_chunks.size() == 1, "duplicate must not add an entry");
    TEST_ASSERT(second->updated_at_ms == first->updated_at_ms, "duplicate must not rewrite the record");
    return true;
}

static bool test_reopen_persists(const std::filesystem::path& workdir) {
    const auto p = fresh_path(workdir, "reopen.json");
    {
        JsonFileResumeStore store;
        TEST_ASSERT(open_store(store, p), "open failed");
        TEST_ASSERT(store.record_chunk_complete("b", 0, 2, 100, "b.bin"), "record b");
        TEST_ASSERT(store.record_chunk_complete("a", 3, 4, 200, "a.bin"), "record a");
        TEST_ASSERT(store.record_chunk_complete("a", 1, 4, 200, "a.bin"), "record a again");
        store.close();
        TEST_ASSERT(!store.is_open(), "close");
    }

    JsonFileResumeStore reopened;
    TEST_ASSERT(open_store(reopened, p), "reopen failed");
    auto all = reopened.list();
    TEST_ASSERT(all.size() == 2, "two records expected after reopen");
    TEST_ASSERT(all[0].upload_id == "a" && all[1].upload_id == "b", "list sorted by id");
    TEST_ASSERT((all[0].completed_chunks == std::vector<uint32_t>{1, 3}), "a chunks survive reopen");
    TEST_ASSERT(all[0].chunk_size == 200 && all[0].total_chunks == 4, "a layout survives reopen");

    std::ifstream in(p);
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    TEST_ASSERT(!doc.is_discarded(), "file must be valid JSON");
    TEST_ASSERT(doc.value("version", 0) == 1, "document version");
    TEST_ASSERT(doc["uploads"].is_array() && doc["uploads"].size() == 2, "uploads array");
    return true;
}

static bool test_remove(const std::filesystem::path& workdir) {
    const auto p = fresh_path(workdir, "remove.json");
    JsonFileResumeStore store;
    TEST_ASSERT(open_store(store, p), "open failed");
    TEST_ASSERT(store.record_chunk_complete("gone", 0, 1, 10, "g"), "record");
    TEST_ASSERT(store.remove("gone"), "remove existing");
    TEST_ASSERT(!store.get("gone").has_value(), "record should be gone");
    TEST_ASSERT(store.remove("never-existed"), "removing unknown id is not an error");

    JsonFileResumeStore reopened;
    TEST_ASSERT(open_store(reopened, p), "reopen failed");
    TEST_ASSERT(reopened.list().empty(), "removal must be durable");
    return true;
}

static bool test_rejects_bad_input(const std::filesystem::path& workdir) {
    const auto p = fresh_path(workdir, "bad_input.json");
    JsonFileResumeStore store;
    TEST_ASSERT(!store.record_chunk_complete("u", 0, 1, 10, "f"), "closed store must reject writes");

    JsonFileResumeStore::Options no_path;
    TEST_ASSERT(!store.open(no_path), "open without path must fail");

    TEST_ASSERT(open_store(store, p), "open failed");
    TEST_ASSERT(!store.record_chunk_complete("u", 4, 4, 10, "f"), "index == total must be rejected");
    TEST_ASSERT(!store.get("u").has_value(), "rejected write must not create a record");
    return true;
}

static bool test_corrupt_file(const std::filesystem::path& workdir) {
    const auto p = fresh_path(workdir, "corrupt.json");
    {
        std::ofstream out(p);
        out << "{ this is not json";
    }

    JsonFileResumeStore store;
    TEST_ASSERT(open_store(store, p), "corrupt file must still open");
    TEST_ASSERT(store.list().empty(), "corrupt file opens empty");
    TEST_ASSERT(store.record_chunk_complete("u", 0, 2, 10, "f"), "store usable after corrupt load");

    const auto p2 = fresh_path(workdir, "mistyped.json");
    {
        std::ofstream out(p2);
        out << R"({"version":1,"uploads":[)"
            << R"({"upload_id":"bad","total_chunks":"three","completed_chunks":[0]},)"
            << R"({"upload_id":"ok","total_chunks":3,"completed_chunks":[0,9,2,2],"chunk_size":5,"filename":"x"})"
            << "]}";
    }
    JsonFileResumeStore mixed;
    TEST_ASSERT(open_store(mixed, p2), "open mixed file");
    auto all = mixed.list();
    TEST_ASSERT(all.size() == 1 && all[0].upload_id == "ok", "malformed record skipped");
    TEST_ASSERT((all[0].completed_chunks == std::vector<uint32_t>{0, 2}),
                "out-of-range and duplicate indices dropped on load");

    const auto p3 = fresh_path(workdir, "negative.json");
    {
        std::ofstream out(p3);
        out << R"({"version":1,"uploads":[)"
            << R"({"upload_id":"neg","total_chunks":-1,"completed_chunks":[0,5,70000]},)"
            << R"({"upload_id":"huge","total_chunks":4294967297,"completed_chunks":[0]},)"
            << R"({"upload_id":"fine","total_chunks":2,"completed_chunks":[1]})"
            << "]}";
    }
    JsonFileResumeStore negative;
    TEST_ASSERT(open_store(negative, p3), "open file with bad counts");
    TEST_ASSERT(!negative.get("neg").has_value(), "negative total_chunks skipped");
    TEST_ASSERT(!negative.get("huge").has_value(), "total_chunks beyond 32 bits skipped");
    TEST_ASSERT(negative.list().size() == 1, "valid sibling record kept");
    return true;
}

static bool test_in_memory_store() {
    InMemoryResumeStore store;
    TEST_ASSERT(store.record_chunk_complete("m", 1, 2, 10, "f"), "record");
    TEST_ASSERT(store.record_chunk_complete("m", 1, 2, 10, "f"), "duplicate record");
    TEST_ASSERT(!store.record_chunk_complete("m", 2, 2, 10, "f"), "out of range");
    TEST_ASSERT(store.get("m")->completed_chunks.size() == 1, "single entry");
    TEST_ASSERT(store.remove("m"), "remove");
    TEST_ASSERT(store.list().empty(), "empty after remove");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    const auto workdir = std::filesystem::temp_directory_path() / "liteupload_resume_store_tests";
    std::error_code ec;
    std::filesystem::create_directories(workdir, ec);

    std::cout << "--- ResumeStore tests (" << workdir << ") ---" << std::endl;

    if (test_record_and_get(workdir)) std::cout << "PASS: record and get" << std::endl;
    if (test_idempotent_record(workdir)) std::cout << "PASS: idempotent record" << std::endl;
    if (test_reopen_persists(workdir)) std::cout << "PASS: reopen persists" << std::endl;
    if (test_remove(workdir)) std::cout << "PASS: remove" << std::endl;
    if (test_rejects_bad_input(workdir)) std::cout << "PASS: rejects bad input" << std::endl;
    if (test_corrupt_file(workdir)) std::cout << "PASS: corrupt file" << std::endl;
    if (test_in_memory_store()) std::cout << "PASS: in-memory store" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
