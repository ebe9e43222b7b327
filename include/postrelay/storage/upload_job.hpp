#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace postrelay::storage {

enum class UploadJobState {
    PENDING,
    UPLOADING,
    SUCCEEDED,
    FAILED
};

const char* to_string(UploadJobState state);
// Unknown tags read back as PENDING so a damaged row is retried rather than lost.
UploadJobState upload_job_state_from_string(const std::string& tag);

// Pending, uploading and failed jobs all count as outstanding.
inline bool is_outstanding(UploadJobState state) {
    return state != UploadJobState::SUCCEEDED;
}

struct UploadJob {
    std::string id;
    std::string text;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    int attempts = 0;
    std::optional<std::string> last_error;
    UploadJobState state = UploadJobState::PENDING;
};

}
