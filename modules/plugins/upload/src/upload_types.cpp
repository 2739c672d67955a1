#include "upload_types.h"

const char* upload_status_to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::QUEUED:    return "queued";
        case UploadStatus::UPLOADING: return "uploading";
        case UploadStatus::COMPLETED: return "completed";
        case UploadStatus::ERROR:     return "error";
        case UploadStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* upload_error_kind_to_string(UploadErrorKind kind) {
    switch (kind) {
        case UploadErrorKind::NONE:                      return "none";
        case UploadErrorKind::VALIDATION:                return "validation";
        case UploadErrorKind::TRANSPORT:                 return "transport";
        case UploadErrorKind::SOURCE_READ:               return "source_read";
        case UploadErrorKind::THROTTLE_MISCONFIGURATION: return "throttle_misconfiguration";
        case UploadErrorKind::RESUME_STORE:              return "resume_store";
    }
    return "unknown";
}
