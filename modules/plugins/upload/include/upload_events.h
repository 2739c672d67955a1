#ifndef UPLOAD_EVENTS_H
#define UPLOAD_EVENTS_H

#include "upload_types.h"

#include <cstdint>
#include <string>
#include <variant>

// --- Job accepted into the pending queue ---
struct UploadQueuedEvent {
    std::string upload_id;
    std::string file_name;
    int priority = DEFAULT_PRIORITY;
    size_t queue_position = 0;
};

// --- Job admitted to the active set ---
struct UploadStartedEvent {
    std::string upload_id;
    uint32_t total_chunks = 0;
    bool chunked = false;
};

// --- One chunk (or the single-shot payload) accepted by the transport ---
struct UploadProgressEvent {
    std::string upload_id;
    uint32_t chunk_index = 0;
    int64_t bytes_uploaded = 0;
    int64_t total_bytes = 0;
    float progress_percent = 0.0f;
};

struct UploadCompletedEvent {
    std::string upload_id;
    int64_t bytes_uploaded = 0;
    int64_t elapsed_ms = 0;
};

struct UploadErrorEvent {
    std::string upload_id;
    UploadErrorKind kind = UploadErrorKind::NONE;
    std::string message;
    int64_t bytes_uploaded = 0;
};

struct UploadCancelledEvent {
    std::string upload_id;
    int64_t bytes_uploaded = 0;
    bool was_active = false;
};

// --- Active job stopped with its resume record kept ---
struct UploadPausedEvent {
    std::string upload_id;
    int64_t bytes_uploaded = 0;
};

struct UploadResumedEvent {
    std::string upload_id;
    uint32_t completed_chunks = 0;
    uint32_t total_chunks = 0;
};

// --- Chunk succeeded but its completion could not be persisted ---
struct ResumeStoreWarningEvent {
    std::string upload_id;
    uint32_t chunk_index = 0;
    int attempts = 0;
};

struct AnalyticsUpdatedEvent {
    AnalyticsSnapshot snapshot;
};

using UploadEvent = std::variant<
    UploadQueuedEvent,
    UploadStartedEvent,
    UploadProgressEvent,
    UploadCompletedEvent,
    UploadErrorEvent,
    UploadCancelledEvent,
    UploadPausedEvent,
    UploadResumedEvent,
    ResumeStoreWarningEvent,
    AnalyticsUpdatedEvent
>;

// Short name for logs, e.g. "progress".
const char* upload_event_name(const UploadEvent& event);

// Upload id the event refers to, empty for engine-wide events.
std::string upload_event_id(const UploadEvent& event);

#endif // UPLOAD_EVENTS_H
