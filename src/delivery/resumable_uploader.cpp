#include "postrelay/delivery/resumable_uploader.hpp"
#include "postrelay/delivery/timeline.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include <algorithm>
#include <charconv>

namespace postrelay::delivery {

using core::utils::FileUtils;

namespace {

// Digits only; a sign, a fraction or a value past uint64_t is rejected.
std::optional<uint64_t> parse_offset_header(const std::string& header) {
    auto text = core::utils::StringUtils::trim(header);
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}

void ResumableUploader::ProgressTracker::report(double value) {
    value = std::clamp(value, 0.0, MAX_UNFINISHED_PROGRESS);
    if (value < last_) {
        return;
    }
    last_ = value;
    if (callback_) {
        callback_(value);
    }
}

void ResumableUploader::ProgressTracker::finish() {
    last_ = 1.0;
    if (callback_) {
        callback_(1.0);
    }
}

ResumableUploader::ResumableUploader(network::HttpClient& client,
                                     transfer::BackgroundTransferBridge& bridge,
                                     storage::OffsetStore& offsets,
                                     transfer::ChunkSlicer slicer,
                                     Sleeper sleeper)
    : client_(client)
    , bridge_(bridge)
    , offsets_(offsets)
    , slicer_(std::move(slicer))
    , sleeper_(sleeper ? std::move(sleeper) : default_sleeper()) {
}

StrategyProfile ResumableUploader::profile() {
    return StrategyProfile{"Resumable + Background", "level3", true, false};
}

std::vector<network::ContentItem> ResumableUploader::fetch_timeline() {
    return load_timeline(client_);
}

DeliveryResult ResumableUploader::submit(const SubmitRequest& request, const ProgressCallback& progress) {
    if (!request.video_path) {
        return DeliveryResult(DeliveryError::VALIDATION, "Level 3 requires selecting a video before posting.");
    }

    const auto& video = *request.video_path;
    auto size = FileUtils::file_size(video);
    if (!size) {
        return DeliveryResult(DeliveryError::VALIDATION, "Cannot read the selected video: " + video.string());
    }
    if (*size == 0) {
        return DeliveryResult(DeliveryError::VALIDATION, "Selected video is empty.");
    }

    ProgressTracker tracker(progress);
    TransferSession session;

    try {
        session = start_session(request.text, video, *size);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start resumable upload: {}", e.what());
        return DeliveryResult(DeliveryError::TERMINAL, e.what());
    }

    session.next_offset = std::max(session.next_offset, stored_offset(session.session_id));
    tracker.report(session.fraction());
    LOG_INFO("Resumable upload started: session={} total={} offset={}",
             session.session_id, core::utils::StringUtils::format_bytes(session.total_bytes), session.next_offset);

    while (session.next_offset < session.total_bytes) {
        for (int attempt = 1; attempt <= MAX_CHUNK_ATTEMPTS; ++attempt) {
            try {
                uint64_t confirmed = upload_chunk(session, video, tracker);
                session.next_offset = confirmed;
                store_offset(session.session_id, session.next_offset);
                LOG_DEBUG("Chunk uploaded. offset={}/{}", session.next_offset, session.total_bytes);
                break;
            } catch (const std::exception& e) {
                LOG_WARN("Chunk failed at offset {}, attempt {}: {}", session.next_offset, attempt, e.what());

                if (attempt >= MAX_CHUNK_ATTEMPTS) {
                    return DeliveryResult(DeliveryError::TERMINAL,
                                          "Resumable upload failed after " + std::to_string(MAX_CHUNK_ATTEMPTS) +
                                          " retries for one chunk.");
                }
            }

            try {
                uint64_t remote = fetch_remote_offset(session.session_id);
                session.next_offset = std::max(session.next_offset, remote);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to query upload status for {}: {}", session.session_id, e.what());
                return DeliveryResult(DeliveryError::TERMINAL, e.what());
            }
            store_offset(session.session_id, session.next_offset);
            sleeper_(std::chrono::seconds(attempt));

            if (session.next_offset >= session.total_bytes) {
                break;
            }
        }
    }

    try {
        complete_session(session.session_id, request.text);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to finalize upload {}: {}", session.session_id, e.what());
        return DeliveryResult(DeliveryError::TERMINAL, e.what());
    }

    session.complete = true;
    clear_offset(session.session_id);
    tracker.finish();
    LOG_INFO("Resumable upload complete for session {}", session.session_id);
    return DeliveryResult();
}

TransferSession ResumableUploader::start_session(const std::string& text, const std::filesystem::path& video,
                                                 uint64_t total_bytes) {
    network::StartSessionRequest body{text, video.filename().string(), total_bytes};
    auto response = network::wire::decode_start_session(
        client_.post_json("/level3/uploads/start", network::wire::encode_start_session(body)));

    TransferSession session;
    session.session_id = response.session_id;
    session.total_bytes = total_bytes;
    session.next_offset = response.next_offset;
    return session;
}

uint64_t ResumableUploader::upload_chunk(const TransferSession& session, const std::filesystem::path& video,
                                         ProgressTracker& tracker) {
    auto chunk = slicer_.slice(video, session.next_offset, session.total_bytes);

    auto request = network::HttpClient::make_request("PUT", session_path(session.session_id) + "/chunk", {
        {"Content-Type", "application/octet-stream"},
        {"Upload-Offset", std::to_string(chunk.offset)},
        {"Upload-Length", std::to_string(session.total_bytes)},
    });

    double total = static_cast<double>(session.total_bytes);
    auto response = bridge_.upload_chunk(request, chunk.path, [&tracker, chunk, total](double fraction) {
        tracker.report((static_cast<double>(chunk.offset) + fraction * static_cast<double>(chunk.length)) / total);
    });

    uint64_t fallback = chunk.offset + chunk.length;
    auto header = response.headers.get("Upload-Offset");
    if (!header) {
        return fallback;
    }

    auto reported = parse_offset_header(*header);
    if (!reported) {
        LOG_DEBUG("Ignoring malformed Upload-Offset header: {}", *header);
        return fallback;
    }
    if (*reported > session.total_bytes) {
        LOG_WARN("Ignoring Upload-Offset {} past the end of session {} ({} bytes)",
                 *reported, session.session_id, session.total_bytes);
        return fallback;
    }
    return std::max(*reported, fallback);
}

uint64_t ResumableUploader::fetch_remote_offset(const std::string& session_id) {
    auto status = network::wire::decode_session_status(client_.get_json(session_path(session_id)));
    return status.offset;
}

void ResumableUploader::complete_session(const std::string& session_id, const std::string& text) {
    client_.post_json(session_path(session_id) + "/complete", network::wire::encode_text_body(text));
}

uint64_t ResumableUploader::stored_offset(const std::string& session_id) {
    try {
        return offsets_.offset(session_id);
    } catch (const storage::StorageError& e) {
        LOG_WARN("Failed to read stored offset for {}: {}", session_id, e.what());
        return 0;
    }
}

void ResumableUploader::store_offset(const std::string& session_id, uint64_t offset) {
    try {
        offsets_.set(session_id, offset);
    } catch (const storage::StorageError& e) {
        LOG_WARN("Failed to persist offset {} for {}: {}", offset, session_id, e.what());
    }
}

void ResumableUploader::clear_offset(const std::string& session_id) {
    try {
        offsets_.clear(session_id);
    } catch (const storage::StorageError& e) {
        LOG_WARN("Failed to clear stored offset for {}: {}", session_id, e.what());
    }
}

std::string ResumableUploader::session_path(const std::string& session_id) {
    return "/level3/uploads/" + session_id;
}

}
